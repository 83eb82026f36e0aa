#include "coffeechat/ui/MainWindow.hpp"

#include <QAction>
#include <QApplication>
#include <QCloseEvent>
#include <QDesktopServices>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QItemSelectionModel>
#include <QLabel>
#include <QLineEdit>
#include <QListView>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QProgressBar>
#include <QPushButton>
#include <QSplitter>
#include <QStatusBar>
#include <QToolBar>
#include <QVBoxLayout>

#include "coffeechat/core/AppContext.hpp"
#include "coffeechat/core/Logging.hpp"
#include "coffeechat/core/SlotFormatter.hpp"
#include "coffeechat/core/TaskOrchestrator.hpp"
#include "coffeechat/ui/ControlStates.hpp"
#include "coffeechat/ui/dialogs/SettingsDialog.hpp"
#include "coffeechat/ui/models/RecipientListModel.hpp"
#include "coffeechat/ui/models/SlotListModel.hpp"
#include "coffeechat/ui/viewmodels/OperationViewModel.hpp"

namespace coffeechat {
namespace ui {

namespace {

// Called from the connect task's worker thread.
void openInBrowser(const QUrl &url)
{
    QMetaObject::invokeMethod(
        qApp, [url]() {
            if (!QDesktopServices::openUrl(url)) {
                qCWarning(lcCalendar) << "Could not open browser for" << url.host();
            }
        },
        Qt::QueuedConnection);
}

} // namespace

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
    , m_appContext(std::make_unique<core::AppContext>(&openInBrowser))
    , m_operationViewModel(std::make_unique<OperationViewModel>(m_appContext->orchestrator()))
    , m_recipientModel(std::make_unique<RecipientListModel>())
    , m_slotModel(std::make_unique<SlotListModel>())
{
    m_recipientModel->setRecipients(m_appContext->settings().recipients);
    setupUi();

    connect(m_operationViewModel.get(), &OperationViewModel::stateChanged, this, &MainWindow::handleStateChanged);
    connect(m_operationViewModel.get(), &OperationViewModel::terminalReached, this, &MainWindow::handleTerminal);
    connect(m_operationViewModel.get(), &OperationViewModel::deliveryProgressed, this,
            &MainWindow::handleDeliveryProgress);
    connect(m_recipientModel.get(), &RecipientListModel::recipientsChanged, this, &MainWindow::updateControls);

    updateControls();
}

MainWindow::~MainWindow() = default;

void MainWindow::setupUi()
{
    auto *toolbar = addToolBar(tr("Actions"));
    toolbar->setMovable(false);
    toolbar->setToolButtonStyle(Qt::ToolButtonTextOnly);
    m_connectAction = toolbar->addAction(tr("Connect Calendar"));
    m_fetchAction = toolbar->addAction(tr("Fetch Slots"));
    m_sendAction = toolbar->addAction(tr("Send Invitations"));
    toolbar->addSeparator();
    m_settingsAction = toolbar->addAction(tr("Settings"));

    m_connectAction->setShortcut(QKeySequence(Qt::CTRL + Qt::Key_K));
    m_fetchAction->setShortcut(QKeySequence(Qt::Key_F5));
    m_sendAction->setShortcut(QKeySequence(Qt::CTRL + Qt::Key_Return));
    m_settingsAction->setShortcut(QKeySequence::Preferences);

    connect(m_connectAction, &QAction::triggered, this, &MainWindow::connectCalendar);
    connect(m_fetchAction, &QAction::triggered, this, &MainWindow::fetchSlots);
    connect(m_sendAction, &QAction::triggered, this, &MainWindow::sendInvitations);
    connect(m_settingsAction, &QAction::triggered, this, &MainWindow::openSettingsDialog);

    auto *splitter = new QSplitter(Qt::Horizontal, this);
    splitter->addWidget(createRecipientPanel());
    splitter->addWidget(createDraftPanel());
    splitter->addWidget(createSlotPanel());
    splitter->setStretchFactor(0, 1);
    splitter->setStretchFactor(1, 2);
    splitter->setStretchFactor(2, 1);
    setCentralWidget(splitter);

    m_statusLabel = new QLabel(this);
    m_busyIndicator = new QProgressBar(this);
    m_busyIndicator->setRange(0, 0);
    m_busyIndicator->setMaximumWidth(120);
    m_busyIndicator->setVisible(false);
    statusBar()->addPermanentWidget(m_statusLabel, 1);
    statusBar()->addPermanentWidget(m_busyIndicator);
}

QWidget *MainWindow::createRecipientPanel()
{
    auto *group = new QGroupBox(tr("Recipients"), this);
    auto *layout = new QVBoxLayout(group);
    layout->setSpacing(6);

    m_recipientView = new QListView(group);
    m_recipientView->setModel(m_recipientModel.get());
    m_recipientView->setSelectionMode(QAbstractItemView::SingleSelection);
    layout->addWidget(m_recipientView, 1);

    auto *form = new QFormLayout();
    m_recipientNameEdit = new QLineEdit(group);
    m_recipientEmailEdit = new QLineEdit(group);
    m_recipientEmailEdit->setPlaceholderText(QStringLiteral("name@example.com"));
    form->addRow(tr("Name"), m_recipientNameEdit);
    form->addRow(tr("Email"), m_recipientEmailEdit);
    layout->addLayout(form);

    auto *buttons = new QHBoxLayout();
    auto *addButton = new QPushButton(tr("Add"), group);
    auto *removeButton = new QPushButton(tr("Remove"), group);
    buttons->addWidget(addButton);
    buttons->addWidget(removeButton);
    layout->addLayout(buttons);

    connect(addButton, &QPushButton::clicked, this, &MainWindow::addRecipient);
    connect(m_recipientEmailEdit, &QLineEdit::returnPressed, this, &MainWindow::addRecipient);
    connect(removeButton, &QPushButton::clicked, this, &MainWindow::removeSelectedRecipient);
    return group;
}

QWidget *MainWindow::createDraftPanel()
{
    auto *group = new QGroupBox(tr("Invitation"), this);
    auto *layout = new QVBoxLayout(group);
    layout->setSpacing(6);

    m_subjectEdit = new QLineEdit(group);
    m_subjectEdit->setPlaceholderText(tr("Subject"));
    m_subjectEdit->setText(m_appContext->settings().subject);
    layout->addWidget(m_subjectEdit);

    m_bodyEdit = new QPlainTextEdit(group);
    m_bodyEdit->setPlainText(m_appContext->settings().body);
    layout->addWidget(m_bodyEdit, 1);

    auto *hint = new QLabel(tr("Use {{ recipient_name }}, {{ sender_name }} and "
                               "{% for slot in availabilities %}{{ slot }}{% endfor %}."),
                            group);
    hint->setWordWrap(true);
    layout->addWidget(hint);
    return group;
}

QWidget *MainWindow::createSlotPanel()
{
    auto *group = new QGroupBox(tr("Free slots"), this);
    auto *layout = new QVBoxLayout(group);
    m_slotView = new QListView(group);
    m_slotView->setModel(m_slotModel.get());
    m_slotView->setSelectionMode(QAbstractItemView::NoSelection);
    layout->addWidget(m_slotView, 1);
    return group;
}

void MainWindow::connectCalendar()
{
    const auto started = m_appContext->orchestrator().startConnect();
    if (!started) {
        statusBar()->showMessage(started.rejection()->message, 3000);
        return;
    }
    m_operationViewModel->notifyStarted();
}

void MainWindow::fetchSlots()
{
    const auto query = m_appContext->settings().calendar.toQuery(QDateTime::currentDateTime());
    const auto started = m_appContext->orchestrator().startFetch(query);
    if (!started) {
        QMessageBox::warning(this, tr("Cannot fetch slots"), started.rejection()->message);
        return;
    }
    m_operationViewModel->notifyStarted();
}

void MainWindow::sendInvitations()
{
    storeDraft();
    const auto &settings = m_appContext->settings();
    auto &orchestrator = m_appContext->orchestrator();

    core::SendRequest request;
    request.smtp = settings.smtp;
    request.senderName = settings.senderName;
    request.subjectTemplate = settings.subject;
    request.bodyTemplate = settings.body;
    request.recipients = settings.recipients;
    request.availabilities = core::summarizeSlots(orchestrator.freeSlots(), settings.calendar.minDurationMinutes);

    if (request.availabilities.isEmpty()) {
        const auto answer = QMessageBox::question(this, tr("No availability"),
                                                  tr("No free slots have been fetched. Send anyway?"));
        if (answer != QMessageBox::Yes) {
            return;
        }
    }

    const auto started = orchestrator.startSend(request);
    if (!started) {
        QMessageBox::warning(this, tr("Cannot send"), started.rejection()->message);
        return;
    }
    m_operationViewModel->notifyStarted();
}

void MainWindow::addRecipient()
{
    const data::Recipient recipient{ m_recipientNameEdit->text(), m_recipientEmailEdit->text() };
    if (!m_recipientModel->addRecipient(recipient)) {
        statusBar()->showMessage(tr("Enter a name and a valid email address."), 3000);
        return;
    }
    m_recipientNameEdit->clear();
    m_recipientEmailEdit->clear();
    m_recipientNameEdit->setFocus(Qt::OtherFocusReason);
    storeDraft();
}

void MainWindow::removeSelectedRecipient()
{
    const QModelIndex current = m_recipientView->selectionModel()->currentIndex();
    if (!current.isValid()) {
        return;
    }
    m_recipientModel->removeRecipient(current.row());
    storeDraft();
}

void MainWindow::openSettingsDialog()
{
    if (!core::isIdle(m_appContext->orchestrator().state())) {
        return;
    }
    if (!m_settingsDialog) {
        m_settingsDialog = std::make_unique<SettingsDialog>(m_appContext->secretStore(), this);
    }
    m_settingsDialog->setSettings(m_appContext->settings());
    if (m_settingsDialog->exec() != QDialog::Accepted) {
        return;
    }
    m_settingsDialog->applyTo(m_appContext->settings());
    m_settingsDialog->storePassword();
    m_appContext->applyCalendarSettings();
    if (!m_appContext->saveSettings()) {
        statusBar()->showMessage(tr("Settings could not be written."), 3000);
    }
}

void MainWindow::handleStateChanged(const core::OperationState &)
{
    updateControls();
}

void MainWindow::handleTerminal(const core::OperationState &state)
{
    auto &orchestrator = m_appContext->orchestrator();
    m_slotModel->setSlots(orchestrator.freeSlots());

    const ControlInputs inputs{ orchestrator.isConnected(), m_recipientModel->rowCount() > 0 };
    statusBar()->showMessage(projectControls(state, inputs).statusText, 5000);

    bool fetchNext = false;
    if (const auto *succeeded = std::get_if<core::state::Succeeded>(&state)) {
        if (succeeded->operation == core::Operation::Connect) {
            fetchNext = true;
        } else if (succeeded->operation == core::Operation::Send) {
            showDeliveryReport();
        }
    } else if (const auto *failed = std::get_if<core::state::Failed>(&state)) {
        if (failed->operation == core::Operation::Send && failed->error.code == core::ErrorCode::PartialSendFailure) {
            showDeliveryReport();
        } else {
            QMessageBox::warning(this, tr("Operation failed"), failed->error.toString());
        }
    }

    m_operationViewModel->acknowledge();
    if (fetchNext) {
        fetchSlots();
    }
}

void MainWindow::handleDeliveryProgress(const core::DeliveryOutcome &outcome)
{
    const int done = m_appContext->orchestrator().deliveryProgress().size();
    const int total = m_appContext->settings().recipients.size();
    if (outcome.delivered) {
        m_statusLabel->setText(tr("Sent to %1 (%2/%3)").arg(outcome.recipient.email).arg(done).arg(total));
    } else {
        m_statusLabel->setText(tr("Failed for %1 (%2/%3): %4")
                                   .arg(outcome.recipient.email)
                                   .arg(done)
                                   .arg(total)
                                   .arg(outcome.reason));
    }
}

void MainWindow::showDeliveryReport()
{
    const auto &report = m_appContext->orchestrator().lastDeliveryReport();
    int delivered = 0;
    QStringList failures;
    for (const auto &outcome : report) {
        if (outcome.delivered) {
            ++delivered;
        } else {
            failures << tr("%1 <%2>: %3").arg(outcome.recipient.name, outcome.recipient.email, outcome.reason);
        }
    }
    const QString summary = tr("Sent %1 of %2 invitation(s).").arg(delivered).arg(report.size());
    if (failures.isEmpty()) {
        QMessageBox::information(this, tr("Invitations sent"), summary);
        return;
    }
    QMessageBox::warning(this, tr("Some invitations failed"),
                         summary + QStringLiteral("\n\n") + failures.join(QLatin1Char('\n')));
}

void MainWindow::updateControls()
{
    auto &orchestrator = m_appContext->orchestrator();
    const ControlInputs inputs{ orchestrator.isConnected(), m_recipientModel->rowCount() > 0 };
    const ControlStates controls = projectControls(m_operationViewModel->state(), inputs);

    m_connectAction->setEnabled(controls.connectEnabled);
    m_fetchAction->setEnabled(controls.fetchEnabled);
    m_sendAction->setEnabled(controls.sendEnabled);
    m_settingsAction->setEnabled(controls.settingsEditable);
    m_busyIndicator->setVisible(controls.busyIndicatorVisible);
    m_statusLabel->setText(controls.statusText);
}

void MainWindow::storeDraft()
{
    auto &settings = m_appContext->settings();
    settings.subject = m_subjectEdit->text();
    settings.body = m_bodyEdit->toPlainText();
    settings.recipients = m_recipientModel->recipients();
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    storeDraft();
    if (core::isInFlight(m_appContext->orchestrator().state())) {
        qCInfo(lcOrchestrator) << "Waiting for"
                                     << core::describe(m_appContext->orchestrator().state()) << "before exit";
    }
    if (!m_appContext->saveSettings()) {
        qCWarning(lcSettings) << "Settings could not be saved on exit";
    }
    event->accept();
}

} // namespace ui
} // namespace coffeechat
