#include "AssetRewriter.hpp"
#include "core/store/UrlSigner.hpp"

#include <libxml/HTMLparser.h>
#include <libxml/HTMLtree.h>
#include <spdlog/spdlog.h>

#include <map>
#include <memory>
#include <regex>

namespace rsb {

namespace {

using DocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

// tag -> attribute that carries its reference
const char* ref_attr_for(const xmlChar* tag) {
  if (xmlStrcasecmp(tag, BAD_CAST "img") == 0) return "src";
  if (xmlStrcasecmp(tag, BAD_CAST "script") == 0) return "src";
  if (xmlStrcasecmp(tag, BAD_CAST "a") == 0) return "href";
  if (xmlStrcasecmp(tag, BAD_CAST "link") == 0) return "href";
  return nullptr;
}

std::string get_attr(xmlNode* n, const char* name) {
  xmlChar* v = xmlGetProp(n, BAD_CAST name);
  if (!v) return {};
  std::string s(reinterpret_cast<const char*>(v));
  xmlFree(v);
  return s;
}

} // namespace

AssetRewriter::AssetRewriter(const UrlSigner& signer, std::vector<std::string> assetDirs)
  : signer_(signer), assetDirs_(std::move(assetDirs)) {}

bool AssetRewriter::isAssetRef(std::string_view ref) const {
  for (const auto& dir : assetDirs_) {
    if (ref.size() > dir.size() && ref.compare(0, dir.size(), dir) == 0) return true;
  }
  return false;
}

std::string AssetRewriter::parentPrefix(const std::string& key) {
  const auto slash = key.rfind('/');
  return slash == std::string::npos ? std::string() : key.substr(0, slash + 1);
}

std::string AssetRewriter::rewriteCssUrls(const std::string& css,
                                          const std::function<std::string(const std::string&)>& map) {
  static const std::regex re(R"re(url\(\s*(['"]?)([^'"\)\s]+)\1\s*\))re", std::regex::icase);

  std::string out;
  auto last = css.cbegin();
  for (std::sregex_iterator it(css.begin(), css.end(), re), end; it != end; ++it) {
    const std::smatch& m = *it;
    out.append(last, m[0].first);
    const std::string mapped = map(m[2].str());
    out += "url(" + m[1].str() + mapped + m[1].str() + ")";
    last = m[0].second;
  }
  out.append(last, css.cend());
  return out;
}

std::string AssetRewriter::rewrite(const std::string& bucket,
                                   const std::string& sourceKey,
                                   const std::string& markup) const {
  if (markup.empty()) return markup;

  DocPtr doc(htmlReadMemory(markup.data(), static_cast<int>(markup.size()), sourceKey.c_str(), "UTF-8",
                            HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING |
                                HTML_PARSE_NONET | HTML_PARSE_NODEFDTD | HTML_PARSE_NOIMPLIED),
             &xmlFreeDoc);
  if (!doc) {
    spdlog::warn("could not parse markup of {}; leaving it unchanged", sourceKey);
    return markup;
  }

  const std::string base = parentPrefix(sourceKey);
  std::map<std::string, std::string> signedFor; // same icon appears many times
  size_t rewritten = 0;

  auto resolve = [&](const std::string& ref) -> std::string {
    if (!isAssetRef(ref)) return ref;
    const std::string key = base + ref;
    auto it = signedFor.find(key);
    if (it == signedFor.end()) it = signedFor.emplace(key, signer_.sign(bucket, key)).first;
    ++rewritten;
    return it->second;
  };

  std::function<void(xmlNode*)> walk = [&](xmlNode* n) {
    for (; n; n = n->next) {
      if (n->type == XML_ELEMENT_NODE) {
        if (const char* attr = ref_attr_for(n->name)) {
          const std::string ref = get_attr(n, attr);
          if (!ref.empty() && isAssetRef(ref)) {
            xmlSetProp(n, BAD_CAST attr, BAD_CAST resolve(ref).c_str());
          }
        }
        if (xmlHasProp(n, BAD_CAST "style")) {
          const std::string style = get_attr(n, "style");
          const std::string updated = rewriteCssUrls(style, resolve);
          if (updated != style) xmlSetProp(n, BAD_CAST "style", BAD_CAST updated.c_str());
        }
        if (xmlStrcasecmp(n->name, BAD_CAST "style") == 0) {
          for (xmlNode* t = n->children; t; t = t->next) {
            if ((t->type != XML_TEXT_NODE && t->type != XML_CDATA_SECTION_NODE) || !t->content) continue;
            const std::string css(reinterpret_cast<const char*>(t->content));
            const std::string updated = rewriteCssUrls(css, resolve);
            if (updated != css) xmlNodeSetContent(t, BAD_CAST updated.c_str());
          }
        }
      }
      walk(n->children);
    }
  };
  walk(doc->children);

  if (rewritten == 0) return markup;

  xmlChar* mem = nullptr;
  int len = 0;
  htmlDocDumpMemoryFormat(doc.get(), &mem, &len, 0);
  if (!mem) throw std::runtime_error("failed to serialize rewritten markup for " + sourceKey);
  std::string out(reinterpret_cast<const char*>(mem), static_cast<size_t>(len));
  xmlFree(mem);

  spdlog::debug("rewrote {} asset reference(s) in {}", rewritten, sourceKey);
  return out;
}

} // namespace rsb
