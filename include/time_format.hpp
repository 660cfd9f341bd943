/**
 * @file time_format.hpp
 * @brief Local-time helpers shared by naming, logging and status output.
 */

#ifndef TIME_FORMAT_HPP
#define TIME_FORMAT_HPP

#include <chrono>
#include <ctime>
#include <filesystem>
#include <string>

/**
 * @brief Breaks a time point down into local calendar fields (thread-safe).
 */
std::tm toLocalTm(std::chrono::system_clock::time_point tp);

/**
 * @brief Builds a time point from local calendar fields, letting mktime resolve DST.
 */
std::chrono::system_clock::time_point fromLocalTm(std::tm tm);

/**
 * @brief Formats a time point in local time with a strftime pattern.
 */
std::string formatLocalTime(std::chrono::system_clock::time_point tp, const char* pattern);

/**
 * @brief Converts a filesystem timestamp to the system clock.
 */
std::chrono::system_clock::time_point toSystemTime(std::filesystem::file_time_type ft);

#endif // TIME_FORMAT_HPP
