#pragma once

#include <memory>

#include "internal/util/time.hpp"

namespace usbforge::db { class Repository; }
namespace usbforge::joblog { class LogSink; }

namespace usbforge::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<usbforge::db::Repository> repository;
  std::shared_ptr<usbforge::joblog::LogSink> log_sink;
  util::ClockFn clock = util::Now;
};

}
