#pragma once
#include <memory>
#include <string>
#include <vector>

#include "core/catalog/Catalog.hpp"
#include "core/catalog/SampleAggregator.hpp"
#include "core/config/Config.hpp"

namespace rsb {

// Turns catalog or sample rows into something a front end can show.
// Picked once at start-up from configuration.
class TableRenderer {
public:
  virtual ~TableRenderer() = default;

  virtual const char* contentType() const = 0;
  virtual std::string renderObjects(const std::vector<ObjectRecord>& rows) const = 0;
  virtual std::string renderSamples(const std::vector<SampleRecord>& rows) const = 0;
};

// Escaped <table> with a leading row-index column.
class HtmlTableRenderer : public TableRenderer {
public:
  const char* contentType() const override { return "text/html; charset=utf-8"; }
  std::string renderObjects(const std::vector<ObjectRecord>& rows) const override;
  std::string renderSamples(const std::vector<SampleRecord>& rows) const override;

  static std::string escape(const std::string& s);
};

// {"columns": [...], "rows": [{...}, ...]} for a client-side data grid.
class JsonGridRenderer : public TableRenderer {
public:
  const char* contentType() const override { return "application/json"; }
  std::string renderObjects(const std::vector<ObjectRecord>& rows) const override;
  std::string renderSamples(const std::vector<SampleRecord>& rows) const override;
};

std::unique_ptr<TableRenderer> make_renderer(TableView view);

} // namespace rsb
