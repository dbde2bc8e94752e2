#include "TableRenderer.hpp"
#include "core/util/TimeFormat.hpp"

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace rsb {

// ---------- html ----------

std::string HtmlTableRenderer::escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&':  out += "&amp;"; break;
      case '<':  out += "&lt;"; break;
      case '>':  out += "&gt;"; break;
      case '"':  out += "&quot;"; break;
      case '\'': out += "&#39;"; break;
      default:   out.push_back(c);
    }
  }
  return out;
}

namespace {

std::string cell(const std::string& s) { return "<td>" + HtmlTableRenderer::escape(s) + "</td>"; }

std::string flag(bool b) { return b ? "yes" : ""; }

std::string header(const std::vector<const char*>& cols) {
  std::string h = "<table class=\"dataframe\">\n<thead><tr><th></th>";
  for (const char* c : cols) h += std::string("<th>") + c + "</th>";
  return h + "</tr></thead>\n<tbody>\n";
}

} // namespace

std::string HtmlTableRenderer::renderObjects(const std::vector<ObjectRecord>& rows) const {
  if (rows.empty()) return "<em>No objects</em>";
  std::string out = header({"key", "size", "last_modified", "storage_class"});
  for (size_t i = 0; i < rows.size(); ++i) {
    const auto& r = rows[i];
    out += "<tr><th>" + std::to_string(i) + "</th>" + cell(r.key) + cell(r.displaySize()) +
           cell(r.displayModified()) + cell(r.storage_class.value_or("")) + "</tr>\n";
  }
  return out + "</tbody>\n</table>";
}

std::string HtmlTableRenderer::renderSamples(const std::vector<SampleRecord>& rows) const {
  if (rows.empty()) return "<em>No samples</em>";
  std::string out = header({"sample", "complete", "quant", "gene_quant", "log", "meta", "files", "last_modified"});
  for (size_t i = 0; i < rows.size(); ++i) {
    const auto& s = rows[i];
    out += "<tr><th>" + std::to_string(i) + "</th>" + cell(s.sample_id) + cell(flag(s.complete)) +
           cell(flag(s.has_quant)) + cell(flag(s.has_gene_quant)) + cell(flag(s.has_log)) +
           cell(flag(s.has_meta)) + cell(std::to_string(s.file_count)) +
           cell(s.latest_modified ? format_utc(*s.latest_modified) : "") + "</tr>\n";
  }
  return out + "</tbody>\n</table>";
}

// ---------- grid ----------

std::string JsonGridRenderer::renderObjects(const std::vector<ObjectRecord>& rows) const {
  json out = {{"columns", {"key", "size", "last_modified", "storage_class"}}, {"rows", json::array()}};
  for (const auto& r : rows) {
    out["rows"].push_back({
      {"key", r.key},
      {"size", r.displaySize()},
      {"size_bytes", r.size ? json(*r.size) : json(nullptr)},
      {"last_modified", r.displayModified()},
      {"storage_class", r.storage_class ? json(*r.storage_class) : json(nullptr)}
    });
  }
  return out.dump();
}

std::string JsonGridRenderer::renderSamples(const std::vector<SampleRecord>& rows) const {
  json out = {{"columns", {"sample", "complete", "quant", "gene_quant", "log", "meta", "files", "last_modified"}},
              {"rows", json::array()}};
  for (const auto& s : rows) {
    out["rows"].push_back({
      {"sample", s.sample_id},
      {"complete", s.complete},
      {"quant", s.has_quant},
      {"gene_quant", s.has_gene_quant},
      {"log", s.has_log},
      {"meta", s.has_meta},
      {"files", s.file_count},
      {"last_modified", s.latest_modified ? json(format_utc(*s.latest_modified)) : json(nullptr)}
    });
  }
  return out.dump();
}

std::unique_ptr<TableRenderer> make_renderer(TableView view) {
  if (view == TableView::Html) return std::make_unique<HtmlTableRenderer>();
  return std::make_unique<JsonGridRenderer>();
}

} // namespace rsb
