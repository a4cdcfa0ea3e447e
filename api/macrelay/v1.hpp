#pragma once

#include "macrelay/v1/types.pb.h"

#include "macrelay/v1/admin_service.pb.h"
#include "macrelay/v1/stream_service.pb.h"

#include "macrelay/v1/admin_service.grpc.pb.h"
#include "macrelay/v1/stream_service.grpc.pb.h"
