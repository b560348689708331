#pragma once

#include "outflow/v1/outward_flow.pb.h"
