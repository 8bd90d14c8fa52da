#pragma once

#include <map>
#include <string>

#include "pv/model/record.h"

namespace pv::orchestrator {

// Key-value record persistence owned by the host application.
class RecordStore {
public:
  virtual ~RecordStore() = default;

  virtual std::map<std::string, model::Record> GetAll() const = 0;
  // Inserts or replaces the record with the same id. False means nothing was
  // stored; IO-domain pv::Error may also be thrown.
  virtual bool Put(const model::Record& record) = 0;
  virtual bool Delete(const std::string& id) = 0;
};

class InMemoryRecordStore : public RecordStore {
public:
  std::map<std::string, model::Record> GetAll() const override;
  bool Put(const model::Record& record) override;
  bool Delete(const std::string& id) override;

  void Clear() noexcept { records_.clear(); }
  std::size_t size() const noexcept { return records_.size(); }

private:
  std::map<std::string, model::Record> records_;
};

}  // namespace pv::orchestrator
