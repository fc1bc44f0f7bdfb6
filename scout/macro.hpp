/*
 * macro.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-01-10

Description: Common macros used across scout

**************************************************/

#ifndef SCOUT_MACRO_HPP
#define SCOUT_MACRO_HPP

#define SCOUT_FILE_NAME __FILE__
#define SCOUT_FILE_LINE __LINE__
#define SCOUT_FUNC_NAME __func__

#endif  // SCOUT_MACRO_HPP
