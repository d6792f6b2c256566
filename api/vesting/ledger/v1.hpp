#pragma once

#include "vesting/ledger/v1/types.pb.h"

#include "vesting/ledger/v1/allocation_service.pb.h"
#include "vesting/ledger/v1/vesting_service.pb.h"
#include "vesting/ledger/v1/admin_service.pb.h"

#include "vesting/ledger/v1/allocation_service.grpc.pb.h"
#include "vesting/ledger/v1/vesting_service.grpc.pb.h"
#include "vesting/ledger/v1/admin_service.grpc.pb.h"
