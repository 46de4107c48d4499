#pragma once
/**
 * @file mcg_service.hpp
 * @brief Layer 2: Service modules built on mcg_base.
 *
 * Provides lifecycle management, the asynchronous Logger, the layered
 * SupervisorConfig, the cross-process SingletonLock, the ProcessTable abstraction
 * over the OS process list, and the ProcessSupervisor that keeps supervised
 * servers within their count and memory ceilings.
 */
#include "mcg_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
#include "utils/supervisor_config.hpp"
#include "utils/singleton_lock.hpp"
#include "utils/process_table.hpp"
#include "utils/process_supervisor.hpp"
