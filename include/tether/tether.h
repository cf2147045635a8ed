#pragma once

#include <tether/computed.h>
#include <tether/config.h>
#include <tether/context.h>
#include <tether/dependency.h>
#include <tether/errors.h>
#include <tether/instance.h>
#include <tether/log.h>
#include <tether/path.h>
#include <tether/scheduler.h>
#include <tether/store.h>
#include <tether/value.h>
#include <tether/watcher.h>
