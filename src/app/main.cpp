#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>
#include <QtCore/QFile>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QStringList>

#include <QtWidgets/QApplication>
#include <QtWidgets/QLabel>
#include <QtWidgets/QMainWindow>
#include <QtWidgets/QMenu>
#include <QtWidgets/QStatusBar>
#include <QtWidgets/QStyle>
#include <QtWidgets/QTextEdit>
#include <QtWidgets/QVBoxLayout>

#include "ribbon/RibbonModel.hpp"
#include "ribbon/state/RibbonUiState.hpp"
#include "ribbon/widgets/RibbonWidget.hpp"

using namespace Ribbon;

static constexpr char clipboardItemsC[] = R"([
	{"name": "paste", "type": "LargeButton", "arguments": {"text": "Paste", "shortcut": "Ctrl+V"}},
	{"name": "cut", "type": "SmallButton", "arguments": {"text": "Cut", "shortcut": "Ctrl+X"}},
	{"name": "copy", "type": "SmallButton", "arguments": {"text": "Copy", "shortcut": "Ctrl+C"}},
	{"name": "formatPainter", "type": "SmallButton", "arguments": {"text": "Format Painter"}}
])";

static void printErrorsAndFail(const QString& header, const QStringList& errors)
{
	qCritical().noquote() << header;
	for (const QString& e : errors)
		qCritical().noquote() << "  " << e;
}

static RibbonResult addItemsFromJson(RibbonPanel* panel, const QByteArray& json)
{
	QJsonParseError parseError;
	const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
	if (parseError.error != QJsonParseError::NoError || !doc.isArray())
		return RibbonResult::failure(RibbonErrorCode::InvalidArgument,
		                             QString("Invalid panel layout: %1").arg(parseError.errorString()));

	const auto specs = PanelItemSpec::listFromJson(doc.array());
	if (!specs)
		return RibbonResult::failure(specs.error());

	const auto added = panel->addItemsBy(*specs);
	if (!added)
		return RibbonResult::failure(added.error());
	return RibbonResult::success();
}

static QStringList buildHomeCategory(RibbonModel& model, QStatusBar* status)
{
	QStringList errors;
	RibbonCategory* home = model.addCategory("Home");

	const auto clipboard = home->addPanel("Clipboard");
	if (!clipboard) {
		errors << clipboard.error().message();
	} else {
		const RibbonResult r = addItemsFromJson(*clipboard, QByteArray(clipboardItemsC));
		if (!r)
			errors << r.error.message();
		for (const PanelItem& item : (*clipboard)->items()) {
			if (!item.action)
				continue;
			QObject::connect(item.action, &QAction::triggered, status, [status, text = item.action->text()] {
				status->showMessage(QString("%1 clicked").arg(text), 2000);
			});
		}
	}

	const auto font = home->addPanel("Font");
	if (!font) {
		errors << font.error().message();
		return errors;
	}

	RibbonPanel* fontPanel = *font;
	if (const auto r = fontPanel->addComboBox("family", {"Sans", "Serif", "Monospace"}); !r)
		errors << r.error().message();
	if (const auto r = fontPanel->addComboBox("size", {"9", "10", "11", "12", "14"}); !r)
		errors << r.error().message();
	if (const auto r = fontPanel->addHorizontalSeparator("fontRule"); !r)
		errors << r.error().message();

	for (const char* name : {"Bold", "Italic", "Underline"}) {
		ButtonOptions options;
		options.text = QString::fromLatin1(name);
		options.showText = false;
		options.toolTip = options.text;
		options.mode = SpaceFindMode::RowWise;
		if (const auto r = fontPanel->addSmallToggleButton(options.text.toLower(), options); !r)
			errors << r.error().message();
	}

	return errors;
}

static QStringList buildViewCategory(RibbonModel& model, QAction*& pictureToolsToggle)
{
	QStringList errors;
	RibbonCategory* view = model.addCategory("View");

	const auto show = view->addPanel("Show", RibbonPanel::DefaultMaximumRows, false);
	if (!show) {
		errors << show.error().message();
		return errors;
	}

	ButtonOptions toggle;
	toggle.text = "Picture Tools";
	toggle.toolTip = "Show the contextual Picture Tools tab";
	const auto action = (*show)->addLargeToggleButton("pictureTools", toggle);
	if (!action) {
		errors << action.error().message();
		return errors;
	}

	pictureToolsToggle = *action;

	if (const auto r = (*show)->addSlider("zoom"); !r)
		errors << r.error().message();
	if (const auto r = (*show)->addLabel("zoomLabel", "Zoom"); !r)
		errors << r.error().message();

	return errors;
}

static QStringList buildPictureTools(RibbonCategory* pictureTools)
{
	QStringList errors;
	const auto adjust = pictureTools->addPanel("Adjust");
	if (!adjust) {
		errors << adjust.error().message();
		return errors;
	}

	if (const auto r = (*adjust)->addGallery("effects", {"None", "Blur", "Sharpen", "Glow", "Shadow"}); !r)
		errors << r.error().message();
	return errors;
}

int main(int argc, char** argv)
{
	QApplication app(argc, argv);
	QCoreApplication::setApplicationName("QtRibbon Demo");

	QCommandLineParser parser;
	parser.setApplicationDescription("Ribbon toolkit demonstration");
	parser.addHelpOption();
	const QCommandLineOption layoutOption("panel-layout",
	                                      "Add a 'Custom' panel built from a JSON item list.",
	                                      "file");
	const QCommandLineOption resetOption("reset-state", "Ignore the saved ribbon state.");
	parser.addOption(layoutOption);
	parser.addOption(resetOption);
	parser.process(app);

	QMainWindow window;
	window.setWindowTitle("QtRibbon Demo");

	auto* central = new QWidget(&window);
	auto* layout = new QVBoxLayout(central);
	layout->setContentsMargins(0, 0, 0, 0);
	layout->setSpacing(0);

	auto* model = new RibbonModel(&window);
	auto* ribbon = new RibbonWidget(central);

	QStringList errors;
	model->beginUpdateBatch();

	QAction* pictureToolsToggle = nullptr;
	errors << buildHomeCategory(*model, window.statusBar());
	errors << buildViewCategory(*model, pictureToolsToggle);

	RibbonCategory* pictureTools = model->addContextCategory("Picture Tools");
	errors << buildPictureTools(pictureTools);
	if (pictureToolsToggle) {
		QObject::connect(pictureToolsToggle, &QAction::toggled, pictureTools, [pictureTools](bool on) {
			const RibbonResult r = pictureTools->setCategoryState(on);
			if (!r)
				qWarning().noquote() << r.error.message();
		});
	}

	if (parser.isSet(layoutOption)) {
		QFile file(parser.value(layoutOption));
		if (!file.open(QIODevice::ReadOnly)) {
			errors << QString("Cannot read %1: %2").arg(file.fileName(), file.errorString());
		} else {
			const auto custom = model->categories().constFirst()->addPanel("Custom");
			if (!custom) {
				errors << custom.error().message();
			} else if (const RibbonResult r = addItemsFromJson(*custom, file.readAll()); !r) {
				errors << r.error.message();
			}
		}
	}

	model->endUpdateBatch();

	if (!errors.isEmpty()) {
		printErrorsAndFail("Failed to build the demo ribbon:", errors);
		return 1;
	}

	RibbonUiState state;
	if (!parser.isSet(resetOption)) {
		const RibbonResult restored = state.restore(*model);
		if (!restored)
			qWarning().noquote() << "Ignoring saved ribbon state:" << restored.error.message();
	}

	ribbon->setModel(model);

	auto* fileMenu = new QMenu(ribbon);
	fileMenu->addAction("New");
	fileMenu->addAction("Open...");
	fileMenu->addSeparator();
	QObject::connect(fileMenu->addAction("Quit"), &QAction::triggered, &app, &QApplication::quit);
	ribbon->setFileMenu(fileMenu);

	auto* undo = new QAction(window.style()->standardIcon(QStyle::SP_ArrowBack), "Undo", &window);
	ribbon->addQuickAccessButton(undo);

	QObject::connect(ribbon, &RibbonWidget::helpButtonClicked, &window, [&window] {
		window.statusBar()->showMessage("Help requested", 2000);
	});

	layout->addWidget(ribbon, 0);
	auto* editor = new QTextEdit(central);
	editor->setPlaceholderText("Document");
	layout->addWidget(editor, 1);
	window.setCentralWidget(central);

	QObject::connect(&app, &QCoreApplication::aboutToQuit, model, [&state, model] {
		state.save(*model);
	});

	window.resize(1100, 700);
	window.show();
	return app.exec();
}
