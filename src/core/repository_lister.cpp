#include "hfpull/repository_lister.hpp"
#include "hfpull/errors.hpp"
#include "hfpull/formatting.hpp"
#include "hfpull/logger.hpp"
#include <nlohmann/json.hpp>
#include <utility>

namespace hfpull {

using json = nlohmann::json;

RepositoryLister::RepositoryLister(HttpClient &client, std::string endpoint)
    : client_(client), endpoint_(std::move(endpoint)) {
  while (!endpoint_.empty() && endpoint_.back() == '/')
    endpoint_.pop_back();
}

std::string RepositoryLister::listingUrl(const RepositoryReference &ref) const {
  std::string url = endpoint_ + "/api/models/" + ref.owner + "/" +
                    ref.repoName + "/tree/" + ref.branch;
  if (!ref.subpath.empty())
    url += "/" + ref.subpath;
  return url;
}

std::vector<RemoteFileEntry>
RepositoryLister::listFiles(const RepositoryReference &ref) {
  const std::string url = listingUrl(ref);
  LOG_INFO("Listing " + ref.owner + "/" + ref.repoName + "@" + ref.branch +
           (ref.subpath.empty() ? "" : " (" + ref.subpath + ")"));

  HttpResponse response;
  try {
    response = client_.get(url);
  } catch (const TransportError &e) {
    LOG_ERROR("Listing request failed: " + std::string(e.what()));
    throw ListError(ListErrorKind::Network, e.what());
  }

  if (response.status < 200 || response.status >= 300) {
    LOG_ERROR("Listing " + url + " returned HTTP " +
              std::to_string(response.status));
    throw ListError(ListErrorKind::NotFound,
                    "Repository listing not available (HTTP " +
                        std::to_string(response.status) + ")",
                    response.status);
  }

  auto files = parseListing(ref, response.body);
  LOG_INFO("Found " + std::to_string(files.size()) + " files, " +
           formatSize(static_cast<double>(totalSize(files))));
  return files;
}

std::vector<RemoteFileEntry>
RepositoryLister::parseListing(const RepositoryReference &ref,
                               const std::string &body) const {
  std::vector<RemoteFileEntry> files;

  json j = json::parse(body, nullptr, false);
  if (j.is_discarded())
    throw ListError(ListErrorKind::Malformed, "Listing is not valid JSON");
  if (!j.is_array())
    throw ListError(ListErrorKind::Malformed, "Listing is not a JSON array");

  for (const auto &item : j) {
    if (!item.is_object() || !item.contains("type") ||
        !item["type"].is_string() || !item.contains("path") ||
        !item["path"].is_string())
      throw ListError(ListErrorKind::Malformed,
                      "Listing entry without type/path: " + item.dump());

    if (item["type"].get<std::string>() != "file")
      continue;

    RemoteFileEntry entry;
    entry.relativePath = item["path"].get<std::string>();
    if (item.contains("size")) {
      if (!item["size"].is_number_unsigned() && !item["size"].is_null())
        throw ListError(ListErrorKind::Malformed,
                        "Invalid size for " + entry.relativePath);
      if (item["size"].is_number_unsigned())
        entry.sizeBytes = item["size"].get<std::uint64_t>();
    }
    entry.downloadUrl = resolveUrl(endpoint_, ref.owner, ref.repoName,
                                   ref.branch, entry.relativePath);
    files.push_back(std::move(entry));
  }

  return files;
}

std::uint64_t totalSize(const std::vector<RemoteFileEntry> &entries) {
  std::uint64_t total = 0;
  for (const auto &e : entries)
    total += e.sizeBytes;
  return total;
}

} // namespace hfpull
