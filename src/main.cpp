#include "hfpull/config.hpp"
#include "hfpull/downloader.hpp"
#include "hfpull/errors.hpp"
#include "hfpull/file_selection.hpp"
#include "hfpull/formatting.hpp"
#include "hfpull/logger.hpp"
#include "hfpull/path_manager.hpp"
#include "hfpull/task_runner.hpp"
#include "hfpull/version.hpp"
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int EXIT_USAGE = 2;
constexpr int EXIT_CANCELLED = 130;

volatile std::sig_atomic_t g_cancelRequested = 0;
volatile std::sig_atomic_t g_pauseRequested = 0;
volatile std::sig_atomic_t g_resumeRequested = 0;

void onSignal(int sig) {
  switch (sig) {
  case SIGINT:
  case SIGTERM:
    g_cancelRequested = 1;
    break;
  case SIGUSR1:
    g_pauseRequested = 1;
    break;
  case SIGUSR2:
    g_resumeRequested = 1;
    break;
  default:
    break;
  }
}

void installSignalHandlers() {
  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);
  std::signal(SIGUSR1, onSignal);
  std::signal(SIGUSR2, onSignal);
}

void showHelp(std::ostream &out = std::cout) {
  out << "hfpull - resumable downloads from Hugging Face style repositories\n\n"
      << "Usage: hfpull <url> [options]\n"
      << "       hfpull help | --help | -h | --version\n\n"
      << "Options:\n"
      << "  -o, --output DIR    Save directory (default: config save_dir)\n"
      << "  -n, --name NAME     File name override for single-file downloads\n"
      << "  -l, --list          List repository files with indices and exit\n"
      << "  -s, --select LIST   Indices to download, e.g. 0,2,5-7 (default: "
         "all)\n"
      << "  -f, --filter TEXT   Only files whose path contains TEXT\n"
      << "  -c, --config PATH   Alternate config file\n"
      << "  -v, --verbose       Echo all log lines to the console\n\n"
      << "Signals:\n"
      << "  SIGINT/SIGTERM cancel, SIGUSR1 pauses, SIGUSR2 resumes.\n"
      << "  An interrupted download resumes where it stopped on the next "
         "run.\n";
}

struct Options {
  std::string url;
  std::string output;
  std::string name;
  std::string select;
  std::string filter;
  std::string configPath;
  bool list = false;
  bool verbose = false;
};

// Serializes the progress line and status messages coming from the worker.
class Console {
public:
  void progress(std::uint64_t downloaded, std::uint64_t total, double speed,
                double percentage) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "\r\033[K" << hfpull::formatProgress(downloaded, total, speed,
                                                      percentage)
              << std::flush;
    lineOpen_ = true;
  }

  void status(const std::string &message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (lineOpen_) {
      std::cout << "\n";
      lineOpen_ = false;
    }
    std::cout << message << std::endl;
  }

private:
  std::mutex mutex_;
  bool lineOpen_ = false;
};

// Waits for the worker while forwarding signal flags to `target`.
template <typename Result, typename Target>
Result supervise(std::future<Result> &future, Target &target) {
  bool cancelForwarded = false;
  while (future.wait_for(std::chrono::milliseconds(100)) !=
         std::future_status::ready) {
    if (g_cancelRequested && !cancelForwarded) {
      LOG_WARN("Cancellation requested by signal");
      target.requestCancel();
      cancelForwarded = true;
    }
    if (g_pauseRequested) {
      g_pauseRequested = 0;
      LOG_INFO("Pause requested by signal");
      target.requestPause();
    }
    if (g_resumeRequested) {
      g_resumeRequested = 0;
      LOG_INFO("Resume requested by signal");
      target.requestResume();
    }
  }
  return future.get();
}

int runSingleFile(hfpull::Downloader &downloader,
                  const hfpull::DownloadTarget &target, const Options &opts) {
  const auto saveDir = hfpull::Downloader::resolveSaveDir(opts.output);
  Console console;
  auto state = std::make_shared<hfpull::TransferState>();

  std::cout << "Downloading " << target.url << "\n"
            << "  -> " << (saveDir / (opts.name.empty() ? target.filename
                                                        : opts.name))
                              .string()
            << "\n";

  auto future = hfpull::TaskRunner::instance().async([&]() {
    return downloader.downloadFile(
        target, saveDir, opts.name, state,
        [&](std::uint64_t d, std::uint64_t t, double s, double p) {
          console.progress(d, t, s, p);
        },
        [&](const std::string &msg) { console.status(msg); });
  });

  try {
    hfpull::TransferOutcome outcome = supervise(future, *state);
    LOG_INFO("Single file transfer finished: " + hfpull::toString(outcome));
    return outcome == hfpull::TransferOutcome::Cancelled ? EXIT_CANCELLED : 0;
  } catch (const hfpull::TransferError &e) {
    std::cerr << "Download failed (" << hfpull::toString(e.kind())
              << "): " << e.what() << "\n";
    return 1;
  }
}

void printListing(const hfpull::FileSelection &selection) {
  const auto &entries = selection.entries();
  size_t width = std::to_string(entries.empty() ? 0 : entries.size() - 1).size();
  std::uint64_t shownBytes = 0;
  size_t shown = 0;
  for (size_t i : selection.visibleIndices()) {
    std::string index = std::to_string(i);
    std::cout << "  [" << std::string(width - index.size(), ' ') << index
              << "] " << entries[i].relativePath << "  ("
              << hfpull::formatSize(static_cast<double>(entries[i].sizeBytes))
              << ")\n";
    shownBytes += entries[i].sizeBytes;
    ++shown;
  }
  std::cout << shown << " files, "
            << hfpull::formatSize(static_cast<double>(shownBytes)) << "\n";
}

void printSummary(const hfpull::FileSelection &selection) {
  const auto indices = selection.selectedIndices();
  std::cout << "Selected " << indices.size() << " files ("
            << hfpull::formatSize(
                   static_cast<double>(selection.selectedBytes()))
            << ")\n";
  const size_t preview = std::min<size_t>(indices.size(), 5);
  for (size_t i = 0; i < preview; ++i)
    std::cout << "  " << selection.entries()[indices[i]].relativePath << "\n";
  if (indices.size() > preview)
    std::cout << "  ... and " << (indices.size() - preview) << " more\n";
}

int runRepository(hfpull::Downloader &downloader,
                  const hfpull::RepositoryReference &ref, const Options &opts) {
  std::cout << "Listing " << hfpull::repositoryUrl(ref, downloader.endpoint())
            << "\n";

  std::vector<hfpull::RemoteFileEntry> entries;
  try {
    entries = downloader.listFiles(ref);
  } catch (const hfpull::ListError &e) {
    std::cerr << "Could not list repository (" << hfpull::toString(e.kind())
              << "): " << e.what() << "\n";
    return 1;
  }

  if (entries.empty()) {
    std::cout << "No files found in this directory.\n";
    return 0;
  }

  hfpull::FileSelection selection(std::move(entries));
  if (!opts.select.empty()) {
    std::vector<size_t> indices;
    try {
      indices =
          hfpull::parseIndexList(opts.select, selection.entries().size());
    } catch (const std::logic_error &e) {
      std::cerr << "Invalid selection '" << opts.select << "': " << e.what()
                << "\n";
      return EXIT_USAGE;
    }
    selection.clear();
    for (size_t index : indices)
      selection.setSelected(index, true);
  }
  selection.setFilter(opts.filter);

  if (opts.list) {
    printListing(selection);
    return 0;
  }

  if (selection.selectedCount() == 0) {
    std::cerr << "No files selected.\n";
    return EXIT_USAGE;
  }

  printSummary(selection);

  const auto saveDir = hfpull::Downloader::resolveSaveDir(opts.output);
  std::cout << "Saving to " << saveDir.string() << "\n";

  Console console;
  auto batch = downloader.makeBatch(saveDir);
  hfpull::BatchCallbacks callbacks;
  callbacks.onProgress = [&](std::uint64_t d, std::uint64_t t, double s,
                             double p) { console.progress(d, t, s, p); };
  callbacks.onStatus = [&](const std::string &msg) { console.status(msg); };
  batch->setCallbacks(std::move(callbacks));
  batch->selectAndQueue(selection.entries(), selection.selectedIndices());

  auto future =
      hfpull::TaskRunner::instance().async([&]() { return batch->run(); });
  hfpull::BatchOutcome outcome = supervise(future, *batch);

  switch (outcome) {
  case hfpull::BatchOutcome::Completed:
    return 0;
  case hfpull::BatchOutcome::Cancelled:
    std::cout << "Stopped after " << batch->currentIndex() << " of "
              << batch->size() << " files.\n";
    return EXIT_CANCELLED;
  default:
    std::cerr << "Batch failed: " << batch->lastError() << "\n";
    return 1;
  }
}

// Returns the value following args[i], advancing i; nullopt when missing.
std::optional<std::string> takeValue(const std::vector<std::string> &args,
                                     size_t &i) {
  if (i + 1 >= args.size())
    return std::nullopt;
  return args[++i];
}

bool parseOptions(const std::vector<std::string> &args, Options &opts,
                  std::string &error) {
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    std::string *target = nullptr;
    if (arg == "-o" || arg == "--output")
      target = &opts.output;
    else if (arg == "-n" || arg == "--name")
      target = &opts.name;
    else if (arg == "-s" || arg == "--select")
      target = &opts.select;
    else if (arg == "-f" || arg == "--filter")
      target = &opts.filter;
    else if (arg == "-c" || arg == "--config")
      target = &opts.configPath;
    else if (arg == "-l" || arg == "--list") {
      opts.list = true;
      continue;
    } else if (!arg.empty() && arg[0] == '-') {
      error = "Unknown option: " + arg;
      return false;
    } else if (opts.url.empty()) {
      opts.url = arg;
      continue;
    } else {
      error = "Unexpected argument: " + arg;
      return false;
    }

    auto value = takeValue(args, i);
    if (!value) {
      error = "Missing value for " + arg;
      return false;
    }
    *target = *value;
  }

  if (opts.url.empty()) {
    error = "No URL given";
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char *argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (!arg.empty()) {
      args.push_back(arg);
    }
  }

  if (!args.empty() &&
      (args[0] == "help" || args[0] == "--help" || args[0] == "-h")) {
    showHelp();
    return 0;
  }

  if (!args.empty() && args[0] == "--version") {
    std::cout << "hfpull v" << hfpull::HFPULL_VERSION_STRING << "\n";
    return 0;
  }

  Options opts;
  auto it = std::find_if(args.begin(), args.end(), [](const std::string &arg) {
    return arg == "-v" || arg == "--verbose";
  });

  if (it != args.end()) {
    opts.verbose = true;
    args.erase(it);
  }

  std::string usageError;
  if (!parseOptions(args, opts, usageError)) {
    std::cerr << "hfpull: " << usageError << "\n\n";
    showHelp(std::cerr);
    return EXIT_USAGE;
  }

  try {
    hfpull::PathManager::instance().init();
    auto &pathMgr = hfpull::PathManager::instance();

    const std::filesystem::path configPath =
        opts.configPath.empty() ? pathMgr.configFile()
                                : std::filesystem::path(opts.configPath);

    hfpull::Logger::instance().init(pathMgr.currentLog(), opts.verbose);
    LOG_INFO("=== hfpull v" + hfpull::HFPULL_VERSION_STRING + " started ===");

    auto &config = hfpull::Config::instance();
    config.load(configPath);
    {
      std::lock_guard<std::recursive_mutex> lock(config.getMutex());
      auto &general = config.getGeneral();
      auto &logger = hfpull::Logger::instance();
      logger.setFileLevel(hfpull::parseLogLevel(general.logLevel));
      if (general.logRetention > 0)
        logger.applyRetention(static_cast<size_t>(general.logRetention));
    }

    installSignalHandlers();

    hfpull::Downloader downloader;
    hfpull::ClassifiedTarget target = downloader.classify(opts.url);

    int code = 0;
    if (auto *file = std::get_if<hfpull::DownloadTarget>(&target)) {
      LOG_INFO("Single file target: " + file->url);
      if (opts.list || !opts.select.empty() || !opts.filter.empty())
        LOG_WARN("--list, --select and --filter only apply to repository "
                 "URLs, ignoring");
      code = runSingleFile(downloader, *file, opts);
    } else if (auto *ref = std::get_if<hfpull::RepositoryReference>(&target)) {
      LOG_INFO("Repository target: " + ref->owner + "/" + ref->repoName +
               " @ " + ref->branch +
               (ref->subpath.empty() ? "" : " /" + ref->subpath));
      code = runRepository(downloader, *ref, opts);
    } else {
      const auto &bad = std::get<hfpull::UnrecognizedTarget>(target);
      std::cerr << "hfpull: cannot use '" << opts.url << "': " << bad.reason
                << "\n";
      code = EXIT_USAGE;
    }

    hfpull::TaskRunner::instance().shutdown();
    LOG_INFO("Exiting with status " + std::to_string(code));
    return code;
  } catch (const std::exception &e) {
    LOG_ERROR(std::string("Fatal: ") + e.what());
    std::cerr << "hfpull: " << e.what() << "\n";
    hfpull::TaskRunner::instance().shutdown();
    return 1;
  }
}
