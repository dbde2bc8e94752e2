// src/main.cpp
#include <algorithm>
#include <iostream>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "core/catalog/CatalogFetcher.hpp"
#include "core/config/Config.hpp"
#include "core/store/S3Client.hpp"
#include "services/api/HttpServer.hpp"
#include "services/browser/BrowserService.hpp"
#include "services/refresh/RefreshCoordinator.hpp"
#include "services/runtime/AwaitOutcome.hpp"
#include "services/runtime/EventLoop.hpp"
#include "services/runtime/ThreadPool.hpp"

using namespace rsb;

// ---------- helpers ----------

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --serve                      # start HTTP server (RSB_PORT or 8080)\n"
            << "  " << argv0 << " --projects                   # list projects under the base prefix\n"
            << "  " << argv0 << " --list <project> [subfolder] # list objects\n"
            << "  " << argv0 << " --samples <project>          # sample completeness table\n"
            << "  " << argv0 << " --extract <key>              # extract a FastQC zip under the web root\n"
            << "  " << argv0 << " --preview <key>              # write a FastQC html preview\n"
            << "  " << argv0 << " --download <key>             # download one object\n"
            << "  " << argv0 << " --sign <key>                 # print a presigned GET URL\n";
}

static CoordinatorSettings coordinator_settings(const AppConfig& cfg) {
  CoordinatorSettings s;
  s.bucket = cfg.bucket;
  s.base_prefix = cfg.base_prefix;
  s.max_objects = cfg.max_objects;
  s.layout.sample_dir = cfg.sample_dir;
  return s;
}

template <typename T>
static int report(const Outcome<T>& r, RefreshCoordinator& coord, EventLoop& loop) {
  std::cerr << loop.invoke([&] { return coord.status(); }).get() << "\n";
  return r.ok() ? 0 : 1;
}

// Everything a mode needs, torn down loop first so no completion runs
// against a coordinator that is going away.
struct App {
  explicit App(const AppConfig& c)
    : cfg(c),
      store(c.s3Options()),
      fetcher(store),
      pool(static_cast<unsigned>(c.workers)),
      coordinator(fetcher, loop, pool, coordinator_settings(c)),
      browser(c, store, coordinator, loop, pool) {
    loop.start();
  }

  ~App() {
    loop.stop();
    pool.shutdown();
  }

  AppConfig cfg;
  S3Client store;
  CatalogFetcher fetcher;
  EventLoop loop;
  ThreadPool pool;
  RefreshCoordinator coordinator;
  BrowserService browser;
};

static int list_mode(App& app, const std::string& project, const std::string& subfolder, bool samples) {
  auto r = await_outcome<std::shared_ptr<const Catalog>>(app.loop, [&](CatalogDone done) {
    return app.browser.listObjects(project, subfolder, std::move(done));
  });
  if (r.ok()) {
    if (samples) {
      const auto rows = app.loop.invoke([&] { return app.coordinator.samples(); }).get();
      std::cout << app.browser.renderer().renderSamples(*rows) << "\n";
    } else {
      std::cout << app.browser.renderer().renderObjects(r.value()->records()) << "\n";
    }
  }
  return report(r, app.coordinator, app.loop);
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      print_usage(argv[0]);
      return 1;
    }
    const std::string mode = argv[1];
    const std::string arg = argc > 2 ? argv[2] : "";

    const AppConfig cfg = load_config();
    spdlog::set_level(spdlog::level::from_str(cfg.log_level));
    if (cfg.credentials.valid()) spdlog::info("Using AWS credentials from the environment ({})", cfg.region);
    else spdlog::info("Resolving AWS credentials through the default provider chain ({})", cfg.region);

    App app(cfg);

    if (mode == "--serve") {
      app.loop.post([&app] {
        app.coordinator.refreshProjects();
        if (app.cfg.poll_interval.count() > 0) {
          app.coordinator.startPolling(std::chrono::duration_cast<std::chrono::milliseconds>(app.cfg.poll_interval));
        }
      });
      run_http_server(app.loop, app.browser, app.browser.files().webRoot().string(), cfg.port, cfg.api_key);
      return 0;
    }

    if (mode == "--projects") {
      auto r = await_outcome<std::shared_ptr<const ProjectList>>(app.loop, [&](ProjectsDone done) {
        return app.browser.refreshProjects(std::move(done));
      });
      if (r.ok()) {
        for (const auto& p : *r.value()) std::cout << p << "\n";
      }
      return report(r, app.coordinator, app.loop);
    }

    if (mode == "--list" && !arg.empty()) {
      return list_mode(app, arg, argc > 3 ? argv[3] : "", false);
    }

    if (mode == "--samples" && !arg.empty()) {
      // A sample directory outside the fixed choices is found from the project root.
      const std::string dir = cfg.sample_dir + "/";
      const auto& choices = BrowserService::subfolderChoices();
      const bool known = std::any_of(choices.begin(), choices.end(),
                                     [&](const auto& c) { return c.second == dir; });
      return list_mode(app, arg, known ? dir : "", true);
    }

    if (mode == "--extract" && !arg.empty()) {
      auto r = await_outcome<ExtractionResult>(app.loop, [&](Done<ExtractionResult> done) {
        app.browser.extractReport(arg, std::move(done));
        return true;
      });
      if (r.ok()) std::cout << (r.value().local_root / r.value().report_path).string() << "\n";
      return report(r, app.coordinator, app.loop);
    }

    if (mode == "--preview" && !arg.empty()) {
      auto r = await_outcome<std::string>(app.loop, [&](Done<std::string> done) {
        app.browser.previewReport(arg, std::move(done));
        return true;
      });
      if (r.ok()) std::cout << r.value() << "\n";
      return report(r, app.coordinator, app.loop);
    }

    if (mode == "--download" && !arg.empty()) {
      auto r = await_outcome<std::string>(app.loop, [&](Done<std::string> done) {
        app.browser.download(arg, std::move(done));
        return true;
      });
      if (r.ok()) std::cout << r.value() << "\n";
      return report(r, app.coordinator, app.loop);
    }

    if (mode == "--sign" && !arg.empty()) {
      auto r = app.loop.invoke([&] { return app.browser.sign(arg); }).get();
      if (r.ok()) std::cout << r.value() << "\n";
      return report(r, app.coordinator, app.loop);
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
