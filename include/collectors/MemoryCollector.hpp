#pragma once
#include "model/Snapshot.hpp"

namespace glance::collectors {

class MemoryCollector {
public:
  bool sample(glance::model::Memory& out) const; // returns true on success
};

} // namespace glance::collectors
