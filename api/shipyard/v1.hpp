#pragma once

#include "shipyard/v1/deploy.pb.h"
#include "shipyard/v1/gateway.pb.h"

#include "shipyard/v1/admin_messages.pb.h"
#include "shipyard/v1/deploy_messages.pb.h"
