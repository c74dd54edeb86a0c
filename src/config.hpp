///
/// @file config.hpp
/// @copyright Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
/// SPDX-License-Identifier: Apache-2.0
/// Licensed under the Apache License, Version 2.0 (the "License");
/// you may not use this file except in compliance with the License.
/// You may obtain a copy of the License at
///
///     http://www.apache.org/licenses/LICENSE-2.0
///
/// Unless required by applicable law or agreed to in writing, software
/// distributed under the License is distributed on an "AS IS" BASIS,
/// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
/// See the License for the specific language governing permissions and
/// limitations under the License.
///
#ifndef CONFIG_HPP
#define CONFIG_HPP

// ----------------------------------------------------------------------------
// Config
// ----------------------------------------------------------------------------

// Target recorded in the metadata of spans and events created through the TB_* macros.
// Define it before including "src/core/tracing/Macros.hpp" to override it per translation unit.
#ifndef TB_TRACING_TARGET
#define TB_TRACING_TARGET "tracebridge"
#endif

// Environment variable selecting the diagnostic log level of the python bridge (error|warning|info|debug|verbose).
// The bridge stays silent when it is unset.
#ifndef TB_LOG_ENV
#define TB_LOG_ENV "TRACEBRIDGE_LOG"
#endif

// Environment variable selecting the most verbose level a registry enables (TRACE|DEBUG|INFO|WARN|ERROR).
// Everything is enabled when it is unset.
#ifndef TB_MAX_LEVEL_ENV
#define TB_MAX_LEVEL_ENV "TRACEBRIDGE_MAX_LEVEL"
#endif

// ----------------------------------------------------------------------------
// AUTOCONFIG
// Better not change anything below unless you know what you are doing
// ----------------------------------------------------------------------------

#if (defined TB_DISABLE_NOEXCEPT)

#if !(defined TB_NOEXCEPT)
#define TB_NOEXCEPT
#endif


#else

#if !(defined TB_NOEXCEPT)
#define TB_NOEXCEPT noexcept
#endif


#endif

#endif // CONFIG_HPP
