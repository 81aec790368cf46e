#pragma once

#include "CursorModel.h"
#include "../model/TabSession.h"
#include <string>

namespace edit {

class TuningModel
{
public:
    // Reads the six string prefixes of a staff
    static model::Tuning readTuning(const model::TabDocument& doc, int staffIndex);

    // Makes the staff's tuning the session tuning
    static model::EditResult learnTuning(model::TabSession& session, const TabContext& ctx);

    // Relabels ctx's string on every staff, then learns the tuning of ctx's staff
    static model::EditResult retuneString(model::TabSession& session, const TabContext& ctx,
                                          const std::string& newNoteName);
};

} // namespace edit
