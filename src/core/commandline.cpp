// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "commandline.h"
#include "logging.h"
#include <KLocalizedString>

namespace VirtDeck {

CommandLineOptions::CommandLineOptions()
    : m_connect(QStringList{QStringLiteral("c"), QStringLiteral("connect")}, i18n("Connect to hypervisor at URI"),
                i18n("URI"))
    , m_showCreator(QStringLiteral("show-domain-creator"), i18n("Show 'New VM' wizard"))
    , m_showEditor(QStringLiteral("show-domain-editor"), i18n("Show domain details window"), i18n("NAME|ID|UUID"))
    , m_showPerformance(QStringLiteral("show-domain-performance"), i18n("Show domain performance window"),
                        i18n("NAME|ID|UUID"))
    , m_showConsole(QStringLiteral("show-domain-console"), i18n("Show domain graphical console window"),
                    i18n("NAME|ID|UUID"))
    , m_showHostSummary(QStringLiteral("show-host-summary"), i18n("Show connection details window"))
    , m_noAutostart(QStringLiteral("no-conn-autostart"), i18n("Do not autostart connections"))
{
}

void CommandLineOptions::addTo(QCommandLineParser& parser) const
{
    parser.addOption(m_connect);
    parser.addOption(m_showCreator);
    parser.addOption(m_showEditor);
    parser.addOption(m_showPerformance);
    parser.addOption(m_showConsole);
    parser.addOption(m_showHostSummary);
    parser.addOption(m_noAutostart);
}

std::optional<CliCommand> CommandLineOptions::command(const QCommandLineParser& parser, QString* error) const
{
    CliCommand command;
    command.uri = parser.value(m_connect);

    int windowOptions = 0;
    if (parser.isSet(m_showCreator)) {
        command.showWindow = QLatin1String(WindowKindName::Creator);
        ++windowOptions;
    }
    if (parser.isSet(m_showEditor)) {
        command.showWindow = QLatin1String(WindowKindName::Editor);
        command.domain = parser.value(m_showEditor);
        ++windowOptions;
    }
    if (parser.isSet(m_showPerformance)) {
        command.showWindow = QLatin1String(WindowKindName::Performance);
        command.domain = parser.value(m_showPerformance);
        ++windowOptions;
    }
    if (parser.isSet(m_showConsole)) {
        command.showWindow = QLatin1String(WindowKindName::Console);
        command.domain = parser.value(m_showConsole);
        ++windowOptions;
    }
    if (parser.isSet(m_showHostSummary)) {
        command.showWindow = QLatin1String(WindowKindName::Summary);
        ++windowOptions;
    }

    if (windowOptions > 1) {
        if (error) {
            *error = i18n("Only one --show-* option can be used at a time");
        }
        return std::nullopt;
    }
    if (windowOptions == 1 && command.uri.isEmpty()) {
        if (error) {
            *error = i18n("Cannot use --show-* options without --connect");
        }
        return std::nullopt;
    }

    // No --show-* option leaves showWindow empty: the manager opens right away
    return command;
}

bool CommandLineOptions::skipAutostart(const QCommandLineParser& parser) const
{
    return parser.isSet(m_noAutostart);
}

std::optional<CliCommand> CommandLineOptions::parseArguments(const QStringList& arguments, QString* error) const
{
    QCommandLineParser parser;
    addTo(parser);
    // Activation arguments carry the standard options too
    parser.addHelpOption();
    parser.addVersionOption();

    if (!parser.parse(arguments)) {
        if (error) {
            *error = parser.errorText();
        }
        qCWarning(lcApp) << "Invalid arguments" << arguments << parser.errorText();
        return std::nullopt;
    }
    return command(parser, error);
}

} // namespace VirtDeck
