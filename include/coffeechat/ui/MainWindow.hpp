#pragma once

#include <QMainWindow>
#include <memory>

#include "coffeechat/core/OperationState.hpp"

class QAction;
class QLabel;
class QLineEdit;
class QListView;
class QPlainTextEdit;
class QProgressBar;

namespace coffeechat {
namespace core {
class AppContext;
struct DeliveryOutcome;
}

namespace ui {

class OperationViewModel;
class RecipientListModel;
class SettingsDialog;
class SlotListModel;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

protected:
    void closeEvent(QCloseEvent *event) override;

private:
    void setupUi();
    QWidget *createRecipientPanel();
    QWidget *createDraftPanel();
    QWidget *createSlotPanel();
    void connectCalendar();
    void fetchSlots();
    void sendInvitations();
    void addRecipient();
    void removeSelectedRecipient();
    void openSettingsDialog();
    void handleStateChanged(const core::OperationState &state);
    void handleTerminal(const core::OperationState &state);
    void handleDeliveryProgress(const core::DeliveryOutcome &outcome);
    void showDeliveryReport();
    void updateControls();
    void storeDraft();

    std::unique_ptr<core::AppContext> m_appContext;
    std::unique_ptr<OperationViewModel> m_operationViewModel;
    std::unique_ptr<RecipientListModel> m_recipientModel;
    std::unique_ptr<SlotListModel> m_slotModel;
    std::unique_ptr<SettingsDialog> m_settingsDialog;

    QAction *m_connectAction = nullptr;
    QAction *m_fetchAction = nullptr;
    QAction *m_sendAction = nullptr;
    QAction *m_settingsAction = nullptr;
    QListView *m_recipientView = nullptr;
    QLineEdit *m_recipientNameEdit = nullptr;
    QLineEdit *m_recipientEmailEdit = nullptr;
    QLineEdit *m_subjectEdit = nullptr;
    QPlainTextEdit *m_bodyEdit = nullptr;
    QListView *m_slotView = nullptr;
    QLabel *m_statusLabel = nullptr;
    QProgressBar *m_busyIndicator = nullptr;
};

} // namespace ui
} // namespace coffeechat
