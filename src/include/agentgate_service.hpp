#pragma once
/**
 * @file agentgate_service.hpp
 * @brief Layer 2: Service modules built on agentgate_base.
 *
 * Provides logging and cryptographic utilities.
 * Include this when you need the Logger (LOGGER_* macros) or CryptoUtils.
 */
#include "agentgate_base.hpp"

#include "utils/crypto_utils.hpp"
#include "utils/logger.hpp"
