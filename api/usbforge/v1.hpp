#pragma once

#include "usbforge/v1/job.pb.h"
#include "usbforge/v1/job_service.pb.h"
