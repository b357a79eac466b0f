#ifndef HFPULL_URL_CLASSIFIER_HPP
#define HFPULL_URL_CLASSIFIER_HPP

#include <string>
#include <variant>
#include <vector>

namespace hfpull {

// Resolved single-file download.
struct DownloadTarget {
  std::string url;
  std::string filename;
};

// A directory inside a model repository.
struct RepositoryReference {
  std::string owner;
  std::string repoName;
  std::string branch;
  std::string subpath; // empty for the repository root
};

struct UnrecognizedTarget {
  std::string reason;
};

using ClassifiedTarget =
    std::variant<DownloadTarget, RepositoryReference, UnrecognizedTarget>;

inline const std::string DEFAULT_ENDPOINT = "https://hf-mirror.com";
inline const std::string DEFAULT_FILENAME = "downloaded_file";

class UrlClassifier {
public:
  // canonicalEndpoint is the scheme+host every recognised repository URL is
  // rewritten to, e.g. "https://hf-mirror.com". Its host is always
  // recognised in addition to the built-in mirror hosts and extraHosts.
  explicit UrlClassifier(std::string canonicalEndpoint = DEFAULT_ENDPOINT,
                         std::vector<std::string> extraHosts = {});

  ClassifiedTarget classify(const std::string &address) const;

  const std::string &endpoint() const { return endpoint_; }
  const std::vector<std::string> &hosts() const { return hosts_; }

private:
  std::string endpoint_;
  std::vector<std::string> hosts_;

  bool isKnownHost(const std::string &host) const;
};

// Decodes %XX escapes; malformed escapes are kept verbatim.
std::string percentDecode(const std::string &text);

// "{endpoint}/{owner}/{repo}/resolve/{branch}/{path}"
std::string resolveUrl(const std::string &endpoint, const std::string &owner,
                       const std::string &repoName, const std::string &branch,
                       const std::string &path);

// Browsable URL of a reference, "{endpoint}/{owner}/{repo}/tree/{branch}[/sub]"
std::string repositoryUrl(const RepositoryReference &ref,
                          const std::string &endpoint);

} // namespace hfpull

#endif // HFPULL_URL_CLASSIFIER_HPP
