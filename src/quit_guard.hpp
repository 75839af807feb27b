#pragma once

#include <string>
#include <vector>
#include "app_info.hpp"
#include "gateway_registry.hpp"

namespace gridsync {

enum class QuitClassification {
    Idle,
    Syncing,
    Loading
};

enum class QuitResponse {
    Yes,
    No
};

enum class PromptIcon {
    Question,
    Warning
};

/**
 * Text and buttons for the quit confirmation dialog.
 */
struct QuitPrompt {
    QuitClassification classification = QuitClassification::Idle;
    PromptIcon icon = PromptIcon::Question;
    std::string title;
    std::string text;
    std::string informative_text;
    std::vector<QuitResponse> responses;
    QuitResponse default_response = QuitResponse::No;
};

enum class CloseAction {
    HideToTray,
    ConfirmQuit
};

/**
 * Quit Guard
 *
 * Looks at every folder of every registered gateway and reports whether
 * quitting now would interrupt loading or syncing. Any loading folder
 * wins over any syncing folder, wherever they are found.
 *
 * The guard only classifies; confirming, hiding the tray and stopping
 * the main loop are left to the caller.
 */
class QuitGuard {
public:
    explicit QuitGuard(const GatewayRegistry& registry, std::string app_name = APP_NAME);

    QuitClassification classify() const;

    QuitPrompt prompt() const;
    QuitPrompt prompt(QuitClassification classification) const;

    std::string informative_text(QuitClassification classification) const;

    // Window close: keep running in the tray when there is one
    static CloseAction on_close_requested(bool tray_available);

private:
    const GatewayRegistry& registry_;
    std::string app_name_;
};

const char* quit_classification_name(QuitClassification classification);

} // namespace gridsync
