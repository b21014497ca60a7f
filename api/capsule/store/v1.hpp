#pragma once

// Generated data model: CapsuleVersion, OwnerRecord, TagMembers,
// OwnerSummary, ReconciliationReport.
#include "capsule/store/v1/capsule.pb.h"
