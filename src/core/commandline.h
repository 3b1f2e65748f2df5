// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "virtdeck_export.h"
#include "types.h"
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QStringList>
#include <optional>

namespace VirtDeck {

/**
 * @brief Command line options that turn into a CliCommand
 *
 * Shared by main() and the single-instance activation path, which re-parses
 * the arguments of a second invocation.
 */
class VIRTDECK_EXPORT CommandLineOptions
{
public:
    CommandLineOptions();

    void addTo(QCommandLineParser& parser) const;

    /**
     * @brief Build the command from a processed parser
     * @param error Set when the options are inconsistent
     * @return The command, or std::nullopt on error
     *
     * A URI without a window opens the manager with that URI selected.
     */
    std::optional<CliCommand> command(const QCommandLineParser& parser, QString* error = nullptr) const;

    bool skipAutostart(const QCommandLineParser& parser) const;

    /**
     * @brief Parse a full argument list (argv[0] first) into a command
     */
    std::optional<CliCommand> parseArguments(const QStringList& arguments, QString* error = nullptr) const;

private:
    QCommandLineOption m_connect;
    QCommandLineOption m_showCreator;
    QCommandLineOption m_showEditor;
    QCommandLineOption m_showPerformance;
    QCommandLineOption m_showConsole;
    QCommandLineOption m_showHostSummary;
    QCommandLineOption m_noAutostart;
};

} // namespace VirtDeck
