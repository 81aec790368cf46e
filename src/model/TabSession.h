#pragma once

#include "ChordAnalysis.h"
#include "Clipboard.h"
#include "SessionSettings.h"
#include "TabDocument.h"
#include "Tuning.h"
#include <optional>
#include <string>

namespace model {

// Which kind of command ran last. Chord analysis uses it to tell a repeated
// invocation from a fresh one, and labelling requires it to be an analysis.
enum class SessionCommand
{
    None,
    Navigate,
    Edit,
    AnalyzeChord,
    LabelChord,
    Other       // Keys and commands that neither edit nor move
};

// Per-document editing state. Everything an operation may read or change
// besides its arguments lives here; there are no globals.
class TabSession
{
public:
    TabSession();
    explicit TabSession(const std::string& text);
    TabSession(const std::string& text, const SessionSettings& settings);

    TabDocument& getDocument() { return document_; }
    const TabDocument& getDocument() const { return document_; }

    Tuning& getTuning() { return tuning_; }
    const Tuning& getTuning() const { return tuning_; }
    void setTuning(const Tuning& tuning) { tuning_ = tuning; }

    Clipboard& getClipboard() { return clipboard_; }
    const Clipboard& getClipboard() const { return clipboard_; }

    EmbKind getPendingEmbellishment() const { return pendingEmb_; }
    void setPendingEmbellishment(EmbKind kind) { pendingEmb_ = kind; }

    const std::optional<ChordAnalysis>& getPendingChord() const { return pendingChord_; }
    void setPendingChord(const ChordAnalysis& chord) { pendingChord_ = chord; }
    void clearPendingChord() { pendingChord_.reset(); }

    SessionCommand getLastCommand() const { return lastCommand_; }
    void setLastCommand(SessionCommand command);

    SessionSettings& getSettings() { return settings_; }
    const SessionSettings& getSettings() const { return settings_; }
    void applySettings(const SessionSettings& settings);

private:
    TabDocument document_;
    Tuning tuning_;
    Clipboard clipboard_;
    SessionSettings settings_;
    EmbKind pendingEmb_ = EmbKind::Normal;
    std::optional<ChordAnalysis> pendingChord_;
    SessionCommand lastCommand_ = SessionCommand::None;
};

} // namespace model
