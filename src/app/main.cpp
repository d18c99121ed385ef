#include <memory>
#include <optional>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QTextStream>

#include "sn/application_settings.h"
#include "sn/event_bus.h"
#include "sn/events.h"
#include "sn/logging_middleware.h"
#include "sn/save_middleware.h"
#include "sn/selectors.h"
#include "sn/storage.h"
#include "sn/store.h"
#include "sn/subscription_manager.h"

namespace {

QTextStream& out() {
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err() {
    static QTextStream stream(stderr);
    return stream;
}

QString q(const std::string& s) {
    return QString::fromStdString(s);
}

void printState(const sn::AppState& state) {
    if (state.content.subjects.empty()) {
        out() << "(no subjects)\n";
    }
    for (const auto& subject : state.content.subjects) {
        const bool selected = state.ui.selection.selectedSubjectId == subject.id;
        out() << (selected ? "* " : "  ") << q(subject.name) << " [" << q(subject.colorName) << "]\n";
        for (const auto* note : sn::sortedNotes(subject, state.settings.defaultSortOption, state.settings.defaultSortOrder)) {
            out() << "    " << (note->title.empty() ? QStringLiteral("Untitled") : q(note->title))
                  << " (" << note->pages.size() << (note->pages.size() == 1 ? " page" : " pages") << ")\n";
        }
    }
    out().flush();
}

int fail(const QString& message) {
    err() << "smartnotes: " << message << "\n";
    err().flush();
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("SmartNotes");
    QCoreApplication::setApplicationName("smartnotes");

    QCommandLineParser parser;
    parser.setApplicationDescription("Command line front end for SmartNotes subjects and notes.");
    parser.addHelpOption();
    QCommandLineOption dataOption("data", "Subject data file.", "file");
    QCommandLineOption settingsOption("settings", "Settings ini file.", "ini");
    QCommandLineOption verboseOption("verbose", "Enable debug logging.");
    parser.addOption(dataOption);
    parser.addOption(settingsOption);
    parser.addOption(verboseOption);
    parser.addPositionalArgument("command",
        "list | add-subject <name> [color] | add-note <subject> <title> | add-page <subject> <note> | "
        "delete-subject <name> | rename-note <subject> <old> <new> | "
        "move-page <subject> <note> <from> <to> | search <text>");
    parser.process(app);

    // Setup logging
#ifdef SN_DEBUG
    QLoggingCategory::setFilterRules("sn.*.debug=true");
#endif
    if (parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules("sn.*.debug=true");
    }

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }
    const QString command = args.first();

    auto settings = parser.isSet(settingsOption)
        ? std::make_unique<sn::ApplicationSettings>(parser.value(settingsOption))
        : std::make_unique<sn::ApplicationSettings>();
    const QString dataFile = parser.isSet(dataOption) ? parser.value(dataOption) : settings->dataFile();

    sn::JsonFileStorage storage(dataFile);
    auto loaded = storage.loadSubjects();
    if (!sn::isSuccess(loaded)) {
        return fail(QString("cannot load %1: %2").arg(dataFile, QString::fromLatin1(sn::storageErrorName(sn::getError(loaded)))));
    }

    sn::AppState initial;
    initial.settings = settings->loadSettingsState();

    sn::EventBus bus;
    sn::Store store(bus, initial);
    store.setDebugLogging(settings->debugLogging() || parser.isSet(verboseOption));

    sn::LoggingMiddleware logging;
    sn::SaveMiddleware saver(store, &storage, settings.get());
    store.registerMiddleware(&logging);
    store.registerMiddleware(&saver);

    store.dispatch(sn::actions::LoadSubjects{sn::getSuccess(loaded)});

    sn::SubscriptionManager view(bus);
    view.subscribe<sn::events::StateChanged>([](const sn::events::StateChanged& e) {
        // Content changes only; navigation and settings are not listed.
        if (e.previous == e.current || e.category == sn::ActionCategory::Navigation
            || e.category == sn::ActionCategory::Settings) {
            return;
        }
        out() << q(e.actionDescription) << "\n";
        printState(*e.current);
    });
    view.subscribe<sn::events::SaveFailed>([](const sn::events::SaveFailed& e) {
        err() << "smartnotes: save failed: " << q(e.reason) << "\n";
    });

    auto argAt = [&args](int i) { return args.value(i).toStdString(); };
    auto requireArgs = [&args, &parser](int count) {
        if (args.size() < count) {
            parser.showHelp(1);
        }
    };
    auto requireSubject = [&store](const std::string& name) {
        return sn::findSubjectByName(store.state(), name);
    };

    if (command == "list") {
        printState(store.state());
    } else if (command == "add-subject") {
        requireArgs(2);
        const std::string color = args.size() > 2 ? argAt(2) : std::string("blue");
        store.dispatch(sn::actions::AddSubject{sn::createSubject(argAt(1), color)});
    } else if (command == "add-note") {
        requireArgs(3);
        const sn::Subject* subject = requireSubject(argAt(1));
        if (!subject) {
            return fail("unknown subject: " + args.at(1));
        }
        store.dispatch(sn::actions::SelectSubject{subject->id});
        if (!sn::createNewNote(store, argAt(2))) {
            return fail("no subject selected");
        }
    } else if (command == "add-page") {
        requireArgs(3);
        const sn::Subject* subject = requireSubject(argAt(1));
        if (!subject) {
            return fail("unknown subject: " + args.at(1));
        }
        const sn::Note* note = sn::findNoteByTitle(*subject, argAt(2));
        if (!note) {
            return fail("unknown note: " + args.at(2));
        }
        const int number = static_cast<int>(note->pages.size()) + 1;
        std::optional<sn::CanvasTemplate> pageTemplate = note->noteTemplate;
        store.dispatch(sn::actions::AddPage{sn::createPage(pageTemplate, number), note->id, subject->id});
    } else if (command == "delete-subject") {
        requireArgs(2);
        const sn::Subject* subject = requireSubject(argAt(1));
        if (!subject) {
            return fail("unknown subject: " + args.at(1));
        }
        store.dispatch(sn::actions::DeleteSubject{subject->id});
    } else if (command == "rename-note") {
        requireArgs(4);
        const sn::Subject* subject = requireSubject(argAt(1));
        if (!subject) {
            return fail("unknown subject: " + args.at(1));
        }
        const sn::Note* note = sn::findNoteByTitle(*subject, argAt(2));
        if (!note) {
            return fail("unknown note: " + args.at(2));
        }
        sn::Note renamed = *note;
        renamed.title = argAt(3);
        store.dispatch(sn::actions::UpdateNote{renamed, subject->id});
    } else if (command == "move-page") {
        requireArgs(5);
        const sn::Subject* subject = requireSubject(argAt(1));
        if (!subject) {
            return fail("unknown subject: " + args.at(1));
        }
        const sn::Note* note = sn::findNoteByTitle(*subject, argAt(2));
        if (!note) {
            return fail("unknown note: " + args.at(2));
        }
        bool fromOk = false;
        bool toOk = false;
        const int from = args.at(3).toInt(&fromOk) - 1;
        const int to = args.at(4).toInt(&toOk) - 1;
        if (!fromOk || !toOk) {
            return fail("page numbers must be integers");
        }
        store.dispatch(sn::actions::ReorderPages{from, to, note->id, subject->id});
    } else if (command == "search") {
        requireArgs(2);
        store.dispatch(sn::actions::UpdateSearchText{args.mid(1).join(' ').toStdString()});
        const auto matches = sn::notesMatchingSearch(store.state());
        for (const auto* note : matches) {
            out() << q(note->title) << "\n";
        }
        out() << matches.size() << (matches.size() == 1 ? " match\n" : " matches\n");
        out().flush();
    } else {
        return fail("unknown command: " + command);
    }

    if (!saver.flush()) {
        return fail("could not save " + dataFile);
    }
    settings->sync();
    return 0;
}
