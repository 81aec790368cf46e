#include "TuningModel.h"
#include <juce_core/juce_core.h>
#include <vector>

using model::EditResult;
using model::EditStatus;
using model::TabDocument;
using model::TabSession;
using model::Tuning;

namespace edit {

Tuning TuningModel::readTuning(const TabDocument& doc, int staffIndex)
{
    Tuning tuning;
    auto staff = doc.getStaff(staffIndex);
    for (int s = 0; s < Tuning::NUM_STRINGS; ++s)
    {
        auto prefix = doc.getLine(staff.firstLine + s).substr(0, Tuning::PREFIX_WIDTH);
        tuning.prefix[static_cast<size_t>(s)] = prefix;
        tuning.pitch[static_cast<size_t>(s)] = model::pitchClassOfPrefix(prefix);
    }
    return tuning;
}

EditResult TuningModel::learnTuning(TabSession& session, const TabContext& ctx)
{
    session.setTuning(readTuning(session.getDocument(), ctx.staffIndex));
    session.setLastCommand(model::SessionCommand::Edit);
    return EditResult::success(ctx.position());
}

EditResult TuningModel::retuneString(TabSession& session, const TabContext& ctx, const std::string& newNoteName)
{
    session.setLastCommand(model::SessionCommand::Edit);

    if (!model::isValidNoteName(newNoteName))
    {
        DBG("Rejecting tuning name: " << juce::String(newNoteName));
        return EditResult::failure(EditStatus::InvalidTuningName, ctx.position());
    }

    auto& doc = session.getDocument();
    auto staves = doc.getStaves();

    std::vector<std::string> prefixes;
    for (int i = 0; i < static_cast<int>(staves.size()); ++i)
    {
        auto prefix = model::makeUniquePrefix(newNoteName, readTuning(doc, i).prefix, ctx.stringIndex);
        if (prefix.empty())
        {
            DBG("Tuning name " << juce::String(newNoteName) << " clashes with staff " << i);
            return EditResult::failure(EditStatus::InvalidTuningName, ctx.position());
        }
        prefixes.push_back(prefix);
    }

    for (size_t i = 0; i < staves.size(); ++i)
    {
        int line = staves[i].firstLine + ctx.stringIndex;
        auto text = doc.getLine(line);
        text.replace(0, Tuning::PREFIX_WIDTH, prefixes[i]);
        doc.setLine(line, text);
    }

    return learnTuning(session, ctx);
}

} // namespace edit
