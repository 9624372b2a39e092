#include <QApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QDir>
#include <QFileInfo>

#include <KAboutData>
#include <KLocalizedString>

#ifdef HAVE_KDBUSSERVICE
#include <KDBusService>
#endif

#include "mainwindow.h"

namespace {

// Resolve command line arguments against workingDir, keeping existing files
QStringList inputFiles(const QStringList &args, const QString &workingDir)
{
    QStringList files;
    const QDir base(workingDir);
    for (const QString &arg : args) {
        const QFileInfo fi(base, arg);
        if (fi.isFile())
            files << fi.absoluteFilePath();
        else
            qWarning() << "pdfmerger: ignoring" << arg << "(not a file)";
    }
    return files;
}

} // namespace

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("pdfmerger");

    KAboutData aboutData(
        QStringLiteral("pdfmerger"),
        i18n("PDF Merger"),
        QStringLiteral("0.1.0"),
        i18n("Merge PDF files and choose the pages taken from each"),
        KAboutLicense::GPL_V3,
        i18n("(c) 2025-2026"));
    aboutData.setOrganizationDomain("pdfmerger.org");
    aboutData.setDesktopFileName(QStringLiteral("org.pdfmerger.PdfMerger"));
    KAboutData::setApplicationData(aboutData);
    app.setWindowIcon(QIcon::fromTheme(QStringLiteral("application-pdf")));

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);
    parser.addPositionalArgument(
        QStringLiteral("files"),
        i18n("PDF files to add to the merge list"),
        QStringLiteral("[files...]"));
    parser.process(app);
    aboutData.processCommandLine(&parser);

    MainWindow window;

#ifdef HAVE_KDBUSSERVICE
    // A second launch forwards its files here and exits
    KDBusService service(KDBusService::Unique);
    QObject::connect(&service, &KDBusService::activateRequested, &window,
                     [&window](const QStringList &activateArgs, const QString &workingDir) {
        const QStringList files = inputFiles(activateArgs.mid(1), workingDir);
        if (files.isEmpty()) {
            window.raise();
            window.activateWindow();
            return;
        }
        window.activateWithFiles(files);
    });
#endif

    const QStringList files = inputFiles(parser.positionalArguments(), QDir::currentPath());
    if (!files.isEmpty())
        window.addFiles(files);

    window.show();
    return app.exec();
}
