#pragma once

#include "baton/coordination/v1/types.pb.h"
#include "baton/coordination/v1/events.pb.h"
#include "baton/coordination/v1/workflow.pb.h"
#include "baton/coordination/v1/coordination_service.pb.h"
