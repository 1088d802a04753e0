#pragma once

#include "stagehand/usecase/Add.hpp"
#include "stagehand/usecase/Apply.hpp"
#include "stagehand/usecase/Delete.hpp"
#include "stagehand/usecase/Diff.hpp"
#include "stagehand/usecase/Edit.hpp"
#include "stagehand/usecase/Reset.hpp"
#include "stagehand/usecase/Status.hpp"
#include "stagehand/usecase/Tag.hpp"
#include "stagehand/usecase/Transfer.hpp"

#include <nlohmann/json.hpp>

namespace stagehand::usecase {

void to_json(nlohmann::json &json, const StatusOutput &output);
void to_json(nlohmann::json &json, const AddOutput &output);
void to_json(nlohmann::json &json, const DraftOutput &output);
void to_json(nlohmann::json &json, const EditOutput &output);
void to_json(nlohmann::json &json, const BaselineOutput &output);
void to_json(nlohmann::json &json, const DeleteOutput &output);
void to_json(nlohmann::json &json, const TagOutput &output);
void to_json(nlohmann::json &json, const ResetOutput &output);
void to_json(nlohmann::json &json, const DiffOutput &output);
void to_json(nlohmann::json &json, const ApplyOutput &output);
void to_json(nlohmann::json &json, const DrainOutput &output);
void to_json(nlohmann::json &json, const PersistOutput &output);

} // namespace stagehand::usecase
