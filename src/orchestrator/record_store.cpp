#include "pv/orchestrator/record_store.h"

namespace pv::orchestrator {

std::map<std::string, model::Record> InMemoryRecordStore::GetAll() const { return records_; }

bool InMemoryRecordStore::Put(const model::Record& record) {
  if (record.id.empty()) {
    return false;
  }
  records_.insert_or_assign(record.id, record);
  return true;
}

bool InMemoryRecordStore::Delete(const std::string& id) { return records_.erase(id) > 0; }

}  // namespace pv::orchestrator
