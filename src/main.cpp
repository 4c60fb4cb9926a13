#include <gflags/gflags.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "Comparison/FileComparisonEngine.hpp"
#include "Config/Config.hpp"
#include "Downloader/DownloadOrchestrator.hpp"
#include "Http/CurlFetcher.hpp"
#include "Inventory/SqliteInventory.hpp"
#include "Registry/PluginLoader.hpp"
#include "Scanner/DirectoryScanner.hpp"
#include "Scanner/SiteScanner.hpp"
#include "Scraper/Scraper.hpp"
#include "Validator/ValidatorRegistry.hpp"
#include "utils/logger.hpp"
#include "utils/url.hpp"

DEFINE_string(include, "new,updated,corrupted",
              "Comparison buckets the download command queues");
DEFINE_string(report, "", "Write a JSON report of the download run to this file");
DEFINE_int32(priority, docfetch::kDefaultPriority,
             "Priority of queued downloads (lower runs first)");

using nlohmann::json;

namespace docfetch {
namespace {

const char* const kUsage =
    "docfetch [flags] <command> [args]\n"
    "  add-site <name> <url> [scraper_type]\n"
    "  sites\n"
    "  scan <site_id>\n"
    "  scan-local <directory>\n"
    "  compare [site_id]\n"
    "  download [site_id]\n"
    "  history [limit]\n"
    "  link <local_id> <remote_id>\n"
    "  unlink <local_id>\n"
    "  plugins";

// Writes job events to the log.
class LoggingListener : public JobEventListener {
 public:
  void onJobStarted(const Job& job) override {
    LOG(INFO) << "[job " << job.id << "] started " << job.spec.url;
  }
  void onJobProgress(const Job& job, double progress) override {
    if (progress < 0) {
      LOG(DEBUG) << "[job " << job.id << "] " << job.bytesDownloaded << " bytes";
    } else {
      LOG(DEBUG) << "[job " << job.id << "] " << static_cast<int>(progress * 100) << "%";
    }
  }
  void onJobCompleted(const Job& job) override {
    LOG(INFO) << "[job " << job.id << "] saved to " << job.localPath.value_or("?");
  }
  void onJobFailed(const Job& job, const std::string& reason) override {
    LOG(ERROR) << "[job " << job.id << "] failed: " << reason;
  }
  void onJobCancelled(const Job& job) override {
    LOG(WARN) << "[job " << job.id << "] cancelled";
  }
};

struct App {
  // 插件加载器必须比注册表活得久
  PluginLoader plugins;
  ScraperRegistry scrapers{"scraper"};
  ValidatorRegistry validators;
  CurlFetcher fetcher;
  std::unique_ptr<SqliteInventory> inventory;
  DownloadConfig config;

  ScraperContext scraperDefaults() {
    ScraperContext ctx;
    ctx.fetcher = &fetcher;
    ctx.userAgent = config.userAgent;
    ctx.proxy = config.proxy;
    ctx.timeout = config.timeout;
    ctx.extensions = documentExtensionsFromFlags();
    return ctx;
  }
};

int64_t parseId(const std::string& text, const char* what) {
  try {
    size_t used = 0;
    long long value = std::stoll(text, &used);
    if (used == text.size()) return value;
  } catch (const std::exception&) {
    // reported below
  }
  throw ConfigurationError(std::string("invalid ") + what + ": '" + text + "'");
}

std::string optionalTime(const std::optional<TimePoint>& tp) {
  return tp ? formatTime(*tp) : std::string("never");
}

json remoteJson(const RemoteFileRecord& remote) {
  json j = {{"id", remote.id},
            {"site_id", remote.siteId},
            {"url", remote.url},
            {"name", remote.name},
            {"type", remote.fileType}};
  j["size"] = remote.size ? json(*remote.size) : json(nullptr);
  return j;
}

json jobJson(const Job& job) {
  json j = {{"id", job.id},
            {"url", job.spec.url},
            {"name", job.spec.displayName},
            {"state", jobStateName(job.state)},
            {"bytes", job.bytesDownloaded},
            {"attempts", job.attempts}};
  if (job.localPath) j["path"] = *job.localPath;
  if (job.lastError) {
    j["error"] = *job.lastError;
    j["error_kind"] = errorKindName(job.errorKind);
  }
  if (job.startedAt) j["started_at"] = formatTime(*job.startedAt);
  if (job.finishedAt) j["finished_at"] = formatTime(*job.finishedAt);
  return j;
}

std::vector<RemoteFileRecord> remoteFilesFor(const App& app, const std::vector<std::string>& args) {
  if (args.empty()) return app.inventory->listAll();
  return app.inventory->listBySite(parseId(args[0], "site id"));
}

ComparisonResult compareFor(App& app, const std::vector<std::string>& args) {
  FileComparisonEngine engine(app.validators);
  return engine.compare(remoteFilesFor(app, args), app.inventory->listLocal());
}

int cmdAddSite(App& app, const std::vector<std::string>& args) {
  if (args.size() < 2) throw ConfigurationError("add-site needs <name> <url>");
  Site site;
  site.name = args[0];
  site.url = utils::normalizeUrl(args[1]);
  site.scraperType = args.size() > 2 ? args[2] : "generic";
  if (!utils::isAbsoluteUrl(site.url)) throw ConfigurationError("not an absolute url: " + args[1]);
  if (!app.scrapers.contains(site.scraperType)) {
    LOG(WARN) << "No scraper registered for type '" << site.scraperType
              << "'; scans will fail until one is loaded";
  }
  int64_t id = app.inventory->addSite(site);
  std::cout << "Added site " << id << ": " << site.name << " (" << site.url << ")" << std::endl;
  return 0;
}

int cmdSites(App& app) {
  for (const auto& site : app.inventory->listSites()) {
    std::cout << site.id << "\t" << site.name << "\t" << site.url << "\t" << site.scraperType
              << "\tlast scan: " << optionalTime(site.lastScanAt) << std::endl;
  }
  return 0;
}

int cmdScan(App& app, const std::vector<std::string>& args) {
  if (args.empty()) throw ConfigurationError("scan needs <site_id>");
  SiteScanner scanner(*app.inventory, *app.inventory, app.scrapers, app.scraperDefaults());
  ScanResult result = scanner.scanSite(parseId(args[0], "site id"));
  if (!result.success) {
    std::cerr << "Scan failed (" << errorKindName(result.errorKind) << "): " << result.error
              << std::endl;
    return 1;
  }
  std::cout << "Found " << result.categoryCount << " categories and " << result.fileCount
            << " files" << std::endl;
  return 0;
}

int cmdScanLocal(App& app, const std::vector<std::string>& args) {
  if (args.empty()) throw ConfigurationError("scan-local needs <directory>");
  DirectoryScanner scanner(*app.inventory, app.validators);
  DirectoryScanResult result = scanner.scanDirectory(args[0], nullptr);
  if (!result.success) {
    std::cerr << result.error << std::endl;
    return 1;
  }
  std::cout << result.filesFound << " files found, " << result.filesAdded << " added, "
            << result.filesUpdated << " updated, " << result.filesInvalid << " invalid"
            << std::endl;
  for (const auto& kv : result.filesByType) {
    std::cout << "  " << kv.first << ": " << kv.second << std::endl;
  }
  return 0;
}

int cmdCompare(App& app, const std::vector<std::string>& args) {
  ComparisonResult result = compareFor(app, args);
  json out = {{"new", json::array()},
              {"updated", json::array()},
              {"corrupted", json::array()},
              {"ok", json::array()}};
  for (const auto& remote : result.newFiles) out["new"].push_back(remoteJson(remote));
  for (const auto& item : result.updatedFiles) {
    json j = remoteJson(item.remote);
    j["local_path"] = item.local.path;
    j["local_size"] = item.local.size;
    out["updated"].push_back(j);
  }
  for (const auto& item : result.corruptedFiles) {
    json j = remoteJson(item.remote);
    j["local_path"] = item.local.path;
    j["reason"] = item.reason;
    out["corrupted"].push_back(j);
  }
  for (const auto& remote : result.okFiles) out["ok"].push_back(remoteJson(remote));
  std::cout << out.dump(2) << std::endl;
  return 0;
}

int cmdDownload(App& app, const std::vector<std::string>& args) {
  bool includeNew = false;
  bool includeUpdated = false;
  bool includeCorrupted = false;
  for (const auto& bucket : utils::splitList(FLAGS_include)) {
    if (bucket == "new") {
      includeNew = true;
    } else if (bucket == "updated") {
      includeUpdated = true;
    } else if (bucket == "corrupted") {
      includeCorrupted = true;
    } else {
      throw ConfigurationError("unknown bucket in --include: " + bucket);
    }
  }

  ComparisonResult comparison = compareFor(app, args);
  std::map<int64_t, std::string> categoryNames;
  for (const auto& site : app.inventory->listSites()) {
    for (const auto& category : app.inventory->listCategories(site.id)) {
      categoryNames[category.id] = category.name;
    }
  }
  std::vector<JobSpec> specs = FileComparisonEngine::buildDownloadQueue(
      comparison, includeNew, includeUpdated, includeCorrupted, categoryNames);
  if (specs.empty()) {
    std::cout << "Nothing to download" << std::endl;
    return 0;
  }

  DownloadOrchestrator orchestrator(app.config, app.fetcher, app.validators, *app.inventory,
                                    *app.inventory);
  orchestrator.subscribe(std::make_shared<LoggingListener>());
  for (const auto& spec : specs) {
    try {
      orchestrator.enqueue(spec, FLAGS_priority);
    } catch (const DuplicateJobError& e) {
      LOG(WARN) << e.what();
    }
  }

  auto begin = std::chrono::steady_clock::now();
  orchestrator.start();
  while (!orchestrator.waitUntilIdle(std::chrono::seconds(5))) {
    LOG(INFO) << orchestrator.listQueue().size() << " queued, "
              << orchestrator.listActive().size() << " active, "
              << orchestrator.listFinished().size() << " finished";
  }
  orchestrator.stop();
  orchestrator.flushEvents(std::chrono::seconds(5));
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - begin);

  json report = {{"download_directory", app.config.downloadDirectory},
                 {"elapsed_ms", elapsed.count()},
                 {"jobs", json::array()}};
  std::map<std::string, int> counts;
  int failures = 0;
  for (const auto& job : orchestrator.listFinished()) {
    report["jobs"].push_back(jobJson(job));
    ++counts[jobStateName(job.state)];
    if (job.state != JobState::COMPLETED) ++failures;
  }
  report["summary"] = counts;

  if (!FLAGS_report.empty()) {
    std::ofstream out(FLAGS_report);
    if (!out) throw IoError("cannot write report to " + FLAGS_report);
    out << report.dump(2) << std::endl;
    LOG(INFO) << "Report written to " << FLAGS_report;
  }
  for (const auto& kv : counts) std::cout << kv.first << ": " << kv.second << std::endl;
  return failures == 0 ? 0 : 1;
}

int cmdHistory(App& app, const std::vector<std::string>& args) {
  size_t limit = args.empty() ? 100 : static_cast<size_t>(parseId(args[0], "limit"));
  for (const auto& record : app.inventory->listDownloads(limit)) {
    auto remote = app.inventory->getById(record.remoteFileId);
    std::cout << record.id << "\t" << downloadStatusName(record.status) << "\t"
              << (remote ? remote->url : "remote #" + std::to_string(record.remoteFileId))
              << "\t" << optionalTime(record.completedAt);
    if (record.errorMessage) std::cout << "\t" << *record.errorMessage;
    std::cout << std::endl;
  }
  return 0;
}

int cmdLink(App& app, const std::vector<std::string>& args) {
  if (args.size() < 2) throw ConfigurationError("link needs <local_id> <remote_id>");
  int64_t localId = parseId(args[0], "local id");
  int64_t remoteId = parseId(args[1], "remote id");
  if (!app.inventory->link(localId, remoteId)) {
    std::cerr << "No local file " << localId << " or remote file " << remoteId << std::endl;
    return 1;
  }
  std::cout << "Linked local file " << localId << " to remote file " << remoteId << std::endl;
  return 0;
}

int cmdUnlink(App& app, const std::vector<std::string>& args) {
  if (args.empty()) throw ConfigurationError("unlink needs <local_id>");
  int64_t localId = parseId(args[0], "local id");
  if (!app.inventory->unlink(localId)) {
    std::cerr << "No local file " << localId << std::endl;
    return 1;
  }
  std::cout << "Unlinked local file " << localId << std::endl;
  return 0;
}

int cmdPlugins(App& app, const std::vector<PluginLoadResult>& loaded) {
  json out = {{"scrapers", app.scrapers.keys()},
              {"validators", app.validators.keys()},
              {"extensions", json::object()},
              {"modules", json::array()}};
  for (const auto& ext : app.validators.supportedExtensions()) {
    out["extensions"][ext] = app.validators.keyForExtension(ext);
  }
  for (const auto& result : loaded) {
    json j = {{"path", result.path}, {"loaded", result.loaded}};
    if (!result.error.empty()) j["error"] = result.error;
    out["modules"].push_back(j);
  }
  std::cout << out.dump(2) << std::endl;
  return 0;
}

int run(const std::string& command, const std::vector<std::string>& args) {
  App app;
  app.config = DownloadConfig::fromFlags();
  app.config.validate();

  registerBuiltinScrapers(app.scrapers);
  registerBuiltinValidators(app.validators);
  PluginRegistrar registrar{app.scrapers, app.validators};
  std::vector<PluginLoadResult> loaded = app.plugins.loadAll(pluginModulesFromFlags(), registrar);
  app.scrapers.freeze();
  app.validators.freeze();

  if (command == "plugins") return cmdPlugins(app, loaded);

  app.inventory = std::make_unique<SqliteInventory>(FLAGS_database);
  if (command == "add-site") return cmdAddSite(app, args);
  if (command == "sites") return cmdSites(app);
  if (command == "scan") return cmdScan(app, args);
  if (command == "scan-local") return cmdScanLocal(app, args);
  if (command == "compare") return cmdCompare(app, args);
  if (command == "download") return cmdDownload(app, args);
  if (command == "history") return cmdHistory(app, args);
  if (command == "link") return cmdLink(app, args);
  if (command == "unlink") return cmdUnlink(app, args);

  std::cerr << "Unknown command: " << command << "\n" << kUsage << std::endl;
  return 2;
}

}  // namespace
}  // namespace docfetch

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage(docfetch::kUsage);
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  if (argc < 2) {
    std::cerr << "Usage: " << docfetch::kUsage << std::endl;
    return 2;
  }

  utils::Logger::initialize(docfetch::logConfigFromFlags());

  std::string command = argv[1];
  std::vector<std::string> args(argv + 2, argv + argc);
  try {
    return docfetch::run(command, args);
  } catch (const docfetch::Error& e) {
    LOG(ERROR) << command << ": " << e.what() << " (" << docfetch::errorKindName(e.kind()) << ")";
    std::cerr << e.what() << std::endl;
    return 1;
  } catch (const std::exception& e) {
    LOG(ERROR) << command << ": " << e.what();
    std::cerr << e.what() << std::endl;
    return 1;
  }
}
