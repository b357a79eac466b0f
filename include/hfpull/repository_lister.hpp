#ifndef HFPULL_REPOSITORY_LISTER_HPP
#define HFPULL_REPOSITORY_LISTER_HPP

#include "hfpull/http.hpp"
#include "hfpull/url_classifier.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace hfpull {

struct RemoteFileEntry {
  std::string relativePath;
  std::string downloadUrl;
  std::uint64_t sizeBytes = 0;
};

class RepositoryLister {
public:
  RepositoryLister(HttpClient &client, std::string endpoint = DEFAULT_ENDPOINT);

  // Direct file entries of the referenced directory, in listing order.
  // Throws ListError.
  std::vector<RemoteFileEntry> listFiles(const RepositoryReference &ref);

  // "{endpoint}/api/models/{owner}/{repo}/tree/{branch}[/{subpath}]"
  std::string listingUrl(const RepositoryReference &ref) const;

  // Parses a listing body. Throws ListError(Malformed).
  std::vector<RemoteFileEntry> parseListing(const RepositoryReference &ref,
                                            const std::string &body) const;

private:
  HttpClient &client_;
  std::string endpoint_;
};

std::uint64_t totalSize(const std::vector<RemoteFileEntry> &entries);

} // namespace hfpull

#endif // HFPULL_REPOSITORY_LISTER_HPP
