#include "hfpull/url_classifier.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <utility>

namespace hfpull {

namespace {

const std::vector<std::string> MIRROR_HOSTS = {"huggingface.co",
                                               "hf-mirror.com"};

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string trim(const std::string &s) {
  auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos)
    return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

struct ParsedUrl {
  std::string scheme;
  std::string host; // lowercase, without port
  std::string authority;
  std::string path; // begins with '/' or is empty
};

bool splitUrl(const std::string &url, ParsedUrl &out) {
  auto schemeEnd = url.find("://");
  if (schemeEnd == std::string::npos)
    return false;
  out.scheme = toLower(url.substr(0, schemeEnd));
  std::string rest = url.substr(schemeEnd + 3);
  auto slash = rest.find('/');
  out.authority = rest.substr(0, slash);
  out.path = slash == std::string::npos ? "" : rest.substr(slash);

  std::string host = out.authority;
  auto at = host.rfind('@');
  if (at != std::string::npos)
    host = host.substr(at + 1);
  if (!host.empty() && host.front() == '[') {
    auto close = host.find(']');
    host = close == std::string::npos ? "" : host.substr(0, close + 1);
  } else {
    host = host.substr(0, host.find(':'));
  }
  out.host = toLower(host);
  return true;
}

std::string hostOf(const std::string &endpoint) {
  ParsedUrl parsed;
  if (splitUrl(endpoint, parsed))
    return parsed.host;
  return toLower(endpoint);
}

std::string lastSegment(const std::string &path) {
  auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

// Decoded before splitting so an encoded '/' cannot smuggle in a directory.
std::string fileNameOf(const std::string &path) {
  std::string name = lastSegment(percentDecode(path));
  if (name.empty() || name == "." || name == "..")
    return DEFAULT_FILENAME;
  return name;
}

} // namespace

UrlClassifier::UrlClassifier(std::string canonicalEndpoint,
                             std::vector<std::string> extraHosts)
    : endpoint_(std::move(canonicalEndpoint)), hosts_(MIRROR_HOSTS) {
  while (!endpoint_.empty() && endpoint_.back() == '/')
    endpoint_.pop_back();

  extraHosts.push_back(hostOf(endpoint_));
  for (const auto &h : extraHosts) {
    std::string host = hostOf(h);
    if (!host.empty() && !isKnownHost(host))
      hosts_.push_back(host);
  }
}

bool UrlClassifier::isKnownHost(const std::string &host) const {
  return std::find(hosts_.begin(), hosts_.end(), host) != hosts_.end();
}

ClassifiedTarget UrlClassifier::classify(const std::string &address) const {
  std::string url = trim(address);
  url = url.substr(0, url.find_first_of("?#"));
  if (url.empty())
    return UnrecognizedTarget{"empty address"};

  // "hf-mirror.com/owner/repo/..." without a scheme is accepted for known
  // hosts only.
  if (url.find("://") == std::string::npos) {
    ParsedUrl bare;
    if (splitUrl("https://" + url, bare) && isKnownHost(bare.host))
      url = "https://" + url;
  }

  ParsedUrl parsed;
  if (!splitUrl(url, parsed) ||
      (parsed.scheme != "http" && parsed.scheme != "https"))
    return UnrecognizedTarget{"not an absolute http(s) URL: " + address};
  if (parsed.host.empty())
    return UnrecognizedTarget{"missing host: " + address};

  if (isKnownHost(parsed.host)) {
    static const std::regex treeRe(R"(^/([^/]+)/([^/]+)/tree/([^/]+)(?:/(.*))?$)");
    static const std::regex fileRe(
        R"(^/([^/]+)/([^/]+)/(?:resolve|blob)/([^/]+)/(.+)$)");
    std::smatch m;

    if (std::regex_match(parsed.path, m, treeRe)) {
      RepositoryReference ref{m[1].str(), m[2].str(), m[3].str(),
                              m[4].matched ? m[4].str() : ""};
      while (!ref.subpath.empty() && ref.subpath.back() == '/')
        ref.subpath.pop_back();
      return ref;
    }

    if (std::regex_match(parsed.path, m, fileRe)) {
      std::string filePath = m[4].str();
      DownloadTarget target;
      target.url = resolveUrl(endpoint_, m[1].str(), m[2].str(), m[3].str(),
                              filePath);
      target.filename = fileNameOf(filePath);
      return target;
    }
  }

  DownloadTarget direct;
  direct.url = url;
  direct.filename = fileNameOf(parsed.path);
  return direct;
}

std::string percentDecode(const std::string &text) {
  auto hexValue = [](char c) -> int {
    if (c >= '0' && c <= '9')
      return c - '0';
    if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
      return c - 'A' + 10;
    return -1;
  };

  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size()) {
      int hi = hexValue(text[i + 1]);
      int lo = hexValue(text[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    out.push_back(text[i]);
  }
  return out;
}

std::string resolveUrl(const std::string &endpoint, const std::string &owner,
                       const std::string &repoName, const std::string &branch,
                       const std::string &path) {
  return endpoint + "/" + owner + "/" + repoName + "/resolve/" + branch + "/" +
         path;
}

std::string repositoryUrl(const RepositoryReference &ref,
                          const std::string &endpoint) {
  std::string url =
      endpoint + "/" + ref.owner + "/" + ref.repoName + "/tree/" + ref.branch;
  if (!ref.subpath.empty())
    url += "/" + ref.subpath;
  return url;
}

} // namespace hfpull
