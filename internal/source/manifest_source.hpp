#pragma once

#include <cstddef>
#include <string>

#include "internal/model/task.hpp"
#include "reconciler/v1/task.pb.h"

namespace reconciler::queue {
class TaskQueue;
}

namespace reconciler::source {

// Throws util::InvalidTask for tasks without a name or action.
model::Task FromProto(const reconciler::v1::Task& task);

/*
  Standalone producer: enqueues every task of a YAML manifest in file
  order. Returns the number of tasks enqueued.
*/
std::size_t EnqueueManifest(const std::string& path, queue::TaskQueue& queue);

} // namespace reconciler::source
