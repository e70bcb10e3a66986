/*
 * macro.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Common macros for mediascan

**************************************************/

#ifndef MEDIASCAN_MACRO_HPP
#define MEDIASCAN_MACRO_HPP

#define MEDIASCAN_FILE_NAME __FILE__
#define MEDIASCAN_FILE_LINE __LINE__
#define MEDIASCAN_FUNC_NAME __func__

#endif  // MEDIASCAN_MACRO_HPP
