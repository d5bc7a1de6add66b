// SPDX-License-Identifier: GPL-2.0
#ifndef CLI_COMMANDS_H
#define CLI_COMMANDS_H

#include <QString>

// Command return codes
constexpr int CMD_SUCCESS = 0;
constexpr int CMD_ERROR = 1;

// Calculate a plan file
// Output: JSON object with the per-segment results, turn pressure and drop advisories
int cmdCalculate(const QString &planPath);

// Longest distance of a swim that stays within the turn pressure
// Output: { "distance": N } or { "distance": null } for anything but a swim
int cmdFixDistance(const QString &planPath, int index);

// Save the standing data and sections of a plan file in the settings
int cmdStore(const QString &planPath);

// Calculate the stored plan
int cmdShow();

#endif // CLI_COMMANDS_H
