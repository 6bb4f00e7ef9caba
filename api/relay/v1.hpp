#pragma once

#include "relay/v1/audit.pb.h"
