#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <utility>

#include "core/util/Errors.hpp"
#include "services/Failures.hpp"
#include "services/browser/BrowserService.hpp"
#include "services/runtime/AwaitOutcome.hpp"

using nlohmann::json;

namespace rsb {

// -------- helpers --------

static bool check_api_key(const httplib::Request& req,
                          const std::string& apiKey,
                          httplib::Response& res) {
  if (apiKey.empty()) return true;
  auto k = req.get_header_value("X-API-Key");
  if (k == apiKey) return true;
  res.status = 401;
  res.set_content("unauthorized", "text/plain");
  return false;
}

static std::string param_or(const httplib::Request& req, const char* k, const std::string& def = {}) {
  if (req.has_param(k)) return req.get_param_value(k);
  return def;
}

static int http_status(FailureKind kind) {
  switch (kind) {
    case FailureKind::Store:            return 502;
    case FailureKind::TooLarge:         return 413;
    case FailureKind::ReportNotFound:   return 422;
    case FailureKind::MalformedArchive: return 422;
    case FailureKind::InvalidRequest:   return 400;
    case FailureKind::Busy:             return 409;
    case FailureKind::Internal:         return 500;
  }
  return 500;
}

static json failure_json(const Failure& f) {
  json j = {{"error", to_string(f.kind)}, {"message", f.message}};
  if (!f.code.empty()) j["code"] = f.code;
  return j;
}

static void send_json(httplib::Response& res, const json& body, int status = 200) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

static void send_failure(httplib::Response& res, const Failure& f) {
  send_json(res, failure_json(f), http_status(f.kind));
}

static json catalog_summary(const Catalog& c) {
  return {
    {"bucket", c.bucket()},
    {"prefix", c.prefix()},
    {"count", c.size()},
    {"cap", c.cap()},
    {"possibly_truncated", c.possiblyTruncated()}
  };
}

static json optional_json(const std::optional<std::string>& v) {
  return v ? json(*v) : json(nullptr);
}

static json stream_json(const StreamState& s) {
  json j = {{"phase", to_string(s.phase)}, {"generation", s.generation}};
  j["last_error"] = s.last_error ? failure_json(*s.last_error) : json(nullptr);
  return j;
}

// -------- server --------

void run_http_server(EventLoop& loop,
                     BrowserService& browser,
                     const std::string& webRoot,
                     int port,
                     const std::string& apiKey) {
  httplib::Server svr;
  RefreshCoordinator& coord = browser.coordinator();

  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // Projects
  svr.Post("/api/projects/refresh", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    auto r = await_outcome<std::shared_ptr<const ProjectList>>(loop, [&browser](ProjectsDone done) {
      return browser.refreshProjects(std::move(done));
    });
    if (!r.ok()) return send_failure(res, r.error());
    const auto preferred = loop.invoke([&] { return coord.preferredProject(); }).get();
    send_json(res, {{"projects", *r.value()}, {"preferred", optional_json(preferred)}});
  });

  svr.Get("/api/projects", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    json body = loop.invoke([&] {
      const auto projects = coord.projects();
      json j = {
        {"projects", projects ? json(*projects) : json::array()},
        {"preferred", optional_json(coord.preferredProject())},
        {"subfolder", coord.subfolder()},
        {"stream", stream_json(coord.projectStream())},
        {"subfolders", json::array()}
      };
      for (const auto& c : BrowserService::subfolderChoices()) {
        j["subfolders"].push_back({{"label", c.first}, {"value", c.second}});
      }
      return j;
    }).get();
    send_json(res, body);
  });

  svr.Post("/api/projects/select", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    const std::string name = param_or(req, "name");
    auto r = await_outcome<std::shared_ptr<const Catalog>>(loop, [&browser, name](CatalogDone done) {
      return browser.coordinator().selectProject(name, std::move(done));
    });
    if (!r.ok()) return send_failure(res, r.error());
    send_json(res, catalog_summary(*r.value()));
  });

  // Objects
  svr.Post("/api/objects", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    const std::string project = param_or(req, "project");
    const std::string subfolder = param_or(req, "subfolder");
    auto r = await_outcome<std::shared_ptr<const Catalog>>(loop, [&browser, project, subfolder](CatalogDone done) {
      return browser.listObjects(project, subfolder, std::move(done));
    });
    if (!r.ok()) return send_failure(res, r.error());
    send_json(res, catalog_summary(*r.value()));
  });

  svr.Get("/api/objects", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    const auto catalog = loop.invoke([&] { return coord.catalog(); }).get();
    res.status = 200;
    res.set_content(JsonGridRenderer().renderObjects(catalog ? catalog->records() : std::vector<ObjectRecord>{}),
                    "application/json");
  });

  svr.Get("/api/objects/table", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    const auto catalog = loop.invoke([&] { return coord.catalog(); }).get();
    const TableRenderer& view = browser.renderer();
    res.status = 200;
    res.set_content(view.renderObjects(catalog ? catalog->records() : std::vector<ObjectRecord>{}),
                    view.contentType());
  });

  // Samples
  svr.Get("/api/samples", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    const auto samples = loop.invoke([&] { return coord.samples(); }).get();
    res.status = 200;
    res.set_content(JsonGridRenderer().renderSamples(*samples), "application/json");
  });

  svr.Get("/api/samples/table", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    const auto samples = loop.invoke([&] { return coord.samples(); }).get();
    const TableRenderer& view = browser.renderer();
    res.status = 200;
    res.set_content(view.renderSamples(*samples), view.contentType());
  });

  // Selection
  svr.Post("/api/select", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    const std::string key = param_or(req, "key");
    const std::string row = param_or(req, "row");
    auto r = loop.invoke([&] {
      return capture([&] {
        if (!key.empty()) {
          browser.selectKey(key);
        } else if (!row.empty()) {
          size_t used = 0;
          unsigned long long idx = 0;
          try {
            idx = std::stoull(row, &used);
          } catch (const std::exception&) {
            used = 0;
          }
          if (used != row.size()) {
            coord.setStatus("Row index must be a number.");
            throw InvalidRequestError("Row index must be a number.");
          }
          browser.selectRow(static_cast<size_t>(idx));
        } else {
          throw InvalidRequestError("key or row required");
        }
        return *coord.selectedKey();
      });
    }).get();
    if (!r.ok()) return send_failure(res, r.error());
    send_json(res, {{"selected", r.value()}});
  });

  // Reports
  svr.Post("/api/extract", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    const std::string key = param_or(req, "key");
    auto r = await_outcome<ExtractionResult>(loop, [&browser, key](Done<ExtractionResult> done) {
      browser.extractReport(key, std::move(done));
      return true;
    });
    if (!r.ok()) return send_failure(res, r.error());
    const auto& v = r.value();
    send_json(res, {
      {"source_key", v.source_key},
      {"local_root", v.local_root.string()},
      {"report_path", v.report_path},
      {"url", v.web_path},
      {"files_written", v.files_written},
      {"entries_skipped", v.entries_skipped},
      {"reused", v.reused}
    });
  });

  svr.Post("/api/preview", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    const std::string key = param_or(req, "key");
    auto r = await_outcome<std::string>(loop, [&browser, key](Done<std::string> done) {
      browser.previewReport(key, std::move(done));
      return true;
    });
    if (!r.ok()) return send_failure(res, r.error());
    send_json(res, {{"url", r.value()}});
  });

  svr.Get("/api/sign", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    const std::string key = param_or(req, "key");
    auto r = loop.invoke([&] { return browser.sign(key); }).get();
    if (!r.ok()) return send_failure(res, r.error());
    send_json(res, {{"url", r.value()}});
  });

  svr.Post("/api/download", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    const std::string key = param_or(req, "key");
    auto r = await_outcome<std::string>(loop, [&browser, key](Done<std::string> done) {
      browser.download(key, std::move(done));
      return true;
    });
    if (!r.ok()) return send_failure(res, r.error());
    send_json(res, {{"path", r.value()}});
  });

  // Status
  svr.Get("/api/status", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    json body = loop.invoke([&] {
      const RefreshState st = coord.refreshState();
      return json{
        {"status", coord.status()},
        {"fetching", st.fetching},
        {"preferred", optional_json(st.preferred_project)},
        {"selected", optional_json(coord.selectedKey())},
        {"projects", stream_json(coord.projectStream())},
        {"objects", stream_json(coord.objectStream())},
        {"polling", coord.polling()},
        {"poll_interval_ms", coord.pollInterval().count()}
      };
    }).get();
    send_json(res, body);
  });

  // Static files: previews and extracted reports live under <web-root>/downloads
  if (!svr.set_mount_point("/", webRoot)) {
    spdlog::error("Cannot mount web root {}", webRoot);
  }

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) res.set_content("not found", "text/plain");
  });

  spdlog::info("HTTP server listening on http://0.0.0.0:{}", port);
  if (!svr.listen("0.0.0.0", port)) {
    spdlog::error("Failed to bind port {}", port);
  }
}

} // namespace rsb
