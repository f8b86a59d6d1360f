#pragma once

#include <string>

namespace reconciler::db::model {

/*
  A workflow as registered by the scheduler.

  Only the fields reconciliation reads are mapped.
*/
struct WorkflowRecord {
  std::string workflow_id;
  bool        paused = false;
};

}
