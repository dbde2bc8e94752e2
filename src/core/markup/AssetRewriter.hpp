#pragma once
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace rsb {

class UrlSigner;

// Rewrites FastQC-style relative asset references (Images/..., Icons/...)
// in standalone report markup into signed URLs for the sibling objects.
// Absolute references and other directories are left alone, so running it
// over its own output changes nothing.
class AssetRewriter {
public:
  explicit AssetRewriter(const UrlSigner& signer,
                         std::vector<std::string> assetDirs = {"Images/", "Icons/"});

  std::string rewrite(const std::string& bucket,
                      const std::string& sourceKey,
                      const std::string& markup) const;

  bool isAssetRef(std::string_view ref) const;

  // "proj/FastQC/x.html" -> "proj/FastQC/"
  static std::string parentPrefix(const std::string& key);

  // Applies `map` to every url(...) target in a CSS fragment.
  static std::string rewriteCssUrls(const std::string& css,
                                    const std::function<std::string(const std::string&)>& map);

private:
  const UrlSigner& signer_;
  std::vector<std::string> assetDirs_;
};

} // namespace rsb
