#include "quit_guard.hpp"
#include "logger.hpp"
#include <utility>

namespace gridsync {

const char* quit_classification_name(QuitClassification classification) {
    switch (classification) {
        case QuitClassification::Idle:    return "idle";
        case QuitClassification::Syncing: return "syncing";
        case QuitClassification::Loading: return "loading";
    }
    return "unknown";
}

QuitGuard::QuitGuard(const GatewayRegistry& registry, std::string app_name)
    : registry_(registry),
      app_name_(std::move(app_name)) {}

QuitClassification QuitGuard::classify() const {
    bool syncing = false;
    for (const auto& gateway : registry_.gateways()) {
        for (const auto& folder : gateway->magic_folders) {
            if (folder.is_loading()) {
                Logger::debug("[QuitGuard] " + gateway->name + "/" + folder.name + " still loading");
                return QuitClassification::Loading;
            }
            if (folder.status == FolderStatus::Syncing) {
                syncing = true;
            }
        }
    }
    return syncing ? QuitClassification::Syncing : QuitClassification::Idle;
}

std::string QuitGuard::informative_text(QuitClassification classification) const {
    switch (classification) {
        case QuitClassification::Loading:
            return "One or more folders have not finished loading. If these "
                   "folders were recently added, you may need to add them again.";
        case QuitClassification::Syncing:
            return "One or more folders are currently syncing. If you quit, any "
                   "pending upload or download operations will be cancelled "
                   "until you launch " + app_name_ + " again.";
        case QuitClassification::Idle:
            break;
    }
    return "If you quit, " + app_name_ + " will stop synchronizing your folders until "
           "you launch it again.";
}

QuitPrompt QuitGuard::prompt() const {
    return prompt(classify());
}

QuitPrompt QuitGuard::prompt(QuitClassification classification) const {
    QuitPrompt prompt;
    prompt.classification = classification;
    prompt.icon = classification == QuitClassification::Idle ? PromptIcon::Question : PromptIcon::Warning;
    prompt.informative_text = informative_text(classification);
    prompt.title = "Exit " + app_name_ + "?";
    prompt.text = "Are you sure you wish to quit? " + prompt.informative_text;
    prompt.responses = {QuitResponse::Yes, QuitResponse::No};
    prompt.default_response = QuitResponse::No;

    Logger::info(std::string("[QuitGuard] Quit requested while ") + quit_classification_name(classification));
    return prompt;
}

CloseAction QuitGuard::on_close_requested(bool tray_available) {
    return tray_available ? CloseAction::HideToTray : CloseAction::ConfirmQuit;
}

} // namespace gridsync
