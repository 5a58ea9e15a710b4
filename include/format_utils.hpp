#pragma once

#include <cstdint>
#include <string>

/**
 * Human-readable formatting helpers shared by the transfer engine and the
 * console front-end.
 */

/**
 * Format bytes into human-readable string (e.g., "52.30 MB")
 *
 * @param bytes Number of bytes
 * @return Formatted string
 */
std::string formatBytes(std::int64_t bytes);

/**
 * Format duration into human-readable string (e.g., "2m 30s").
 * Negative durations are reported as "unknown".
 *
 * @param seconds Duration in seconds
 * @return Formatted string
 */
std::string formatDuration(long seconds);

/**
 * Short reason text for an HTTP status. Codes without their own entry are
 * described by class ("Client Error", "Server Error", ...).
 */
std::string httpStatusText(long code);
