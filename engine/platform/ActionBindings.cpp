#include "engine/platform/ActionBindings.hpp"

#include <filesystem>
#include <fstream>
#include <unordered_map>

#include <GLFW/glfw3.h>
#include <nlohmann/json.hpp>

#include "engine/platform/Input.hpp"

namespace engine::platform
{
namespace
{
using json = nlohmann::json;

const std::unordered_map<int, std::string> kCodeToText{
    {GLFW_KEY_A, "A"},
    {GLFW_KEY_D, "D"},
    {GLFW_KEY_Q, "Q"},
    {GLFW_KEY_R, "R"},
    {GLFW_KEY_W, "W"},
    {GLFW_KEY_SPACE, "Space"},
    {GLFW_KEY_LEFT, "Left"},
    {GLFW_KEY_RIGHT, "Right"},
    {GLFW_KEY_UP, "Up"},
    {GLFW_KEY_TAB, "Tab"},
    {GLFW_KEY_ENTER, "Enter"},
    {GLFW_KEY_ESCAPE, "Esc"},
};
} // namespace

ActionBindings::ActionBindings()
{
    ResetDefaults();
}

void ActionBindings::ResetDefaults()
{
    for (ActionBinding& binding : m_bindings)
    {
        binding = ActionBinding{};
    }

    SetCode(InputAction::MoveLeft, 0, GLFW_KEY_A);
    SetCode(InputAction::MoveLeft, 1, GLFW_KEY_LEFT);
    SetCode(InputAction::MoveRight, 0, GLFW_KEY_D);
    SetCode(InputAction::MoveRight, 1, GLFW_KEY_RIGHT);
    SetCode(InputAction::Jump, 0, GLFW_KEY_SPACE);
    SetCode(InputAction::CycleSeason, 0, GLFW_KEY_Q);
    SetCode(InputAction::RestartRun, 0, GLFW_KEY_R);
    SetCode(InputAction::Quit, 0, GLFW_KEY_ESCAPE);
}

const ActionBinding& ActionBindings::Get(InputAction action) const
{
    return m_bindings[static_cast<std::size_t>(action)];
}

void ActionBindings::Set(InputAction action, const ActionBinding& binding)
{
    m_bindings[static_cast<std::size_t>(action)] = binding;
}

void ActionBindings::SetCode(InputAction action, int slot, int code)
{
    ActionBinding& binding = m_bindings[static_cast<std::size_t>(action)];
    if (slot <= 0)
    {
        binding.primary = code;
    }
    else
    {
        binding.secondary = code;
    }
}

int ActionBindings::GetCode(InputAction action, int slot) const
{
    const ActionBinding& binding = m_bindings[static_cast<std::size_t>(action)];
    return slot <= 0 ? binding.primary : binding.secondary;
}

bool ActionBindings::IsDown(const Input& input, InputAction action) const
{
    const ActionBinding& binding = Get(action);
    return input.IsKeyDown(binding.primary) || input.IsKeyDown(binding.secondary);
}

bool ActionBindings::IsPressed(const Input& input, InputAction action) const
{
    const ActionBinding& binding = Get(action);
    return input.IsKeyPressed(binding.primary) || input.IsKeyPressed(binding.secondary);
}

std::optional<std::pair<InputAction, int>> ActionBindings::FindConflict(int code, InputAction ignoredAction, int ignoredSlot) const
{
    if (code == kUnbound)
    {
        return std::nullopt;
    }

    for (InputAction action : AllActions())
    {
        const ActionBinding& binding = Get(action);
        if (!(action == ignoredAction && ignoredSlot == 0) && binding.primary == code)
        {
            return std::pair<InputAction, int>{action, 0};
        }
        if (!(action == ignoredAction && ignoredSlot == 1) && binding.secondary == code)
        {
            return std::pair<InputAction, int>{action, 1};
        }
    }

    return std::nullopt;
}

bool ActionBindings::LoadFromJsonFile(const std::string& path, std::string* outError)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Cannot open controls file: " + path;
        }
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& ex)
    {
        if (outError != nullptr)
        {
            *outError = std::string{"Invalid controls JSON: "} + ex.what();
        }
        return false;
    }

    if (!root.contains("bindings") || !root["bindings"].is_object())
    {
        if (outError != nullptr)
        {
            *outError = "Missing controls.bindings object";
        }
        return false;
    }

    for (InputAction action : AllActions())
    {
        const char* actionName = ActionName(action);
        if (!root["bindings"].contains(actionName))
        {
            continue;
        }
        const json& node = root["bindings"][actionName];
        if (!node.is_object())
        {
            continue;
        }
        ActionBinding binding = Get(action);
        if (node.contains("primary") && node["primary"].is_number_integer())
        {
            binding.primary = node["primary"].get<int>();
        }
        if (node.contains("secondary") && node["secondary"].is_number_integer())
        {
            binding.secondary = node["secondary"].get<int>();
        }
        Set(action, binding);
    }

    return true;
}

bool ActionBindings::SaveToJsonFile(const std::string& path, std::string* outError) const
{
    const std::filesystem::path filePath(path);
    if (filePath.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(filePath.parent_path(), ec);
    }

    json root;
    root["asset_version"] = 1;
    json bindings = json::object();
    for (InputAction action : AllActions())
    {
        const ActionBinding& binding = Get(action);
        bindings[ActionName(action)] = {
            {"primary", binding.primary},
            {"secondary", binding.secondary},
        };
    }
    root["bindings"] = std::move(bindings);

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Cannot write controls file: " + path;
        }
        return false;
    }

    stream << root.dump(2) << "\n";
    return true;
}

std::vector<InputAction> ActionBindings::AllActions()
{
    return {
        InputAction::MoveLeft,
        InputAction::MoveRight,
        InputAction::Jump,
        InputAction::CycleSeason,
        InputAction::RestartRun,
        InputAction::Quit,
    };
}

const char* ActionBindings::ActionName(InputAction action)
{
    switch (action)
    {
        case InputAction::MoveLeft: return "MoveLeft";
        case InputAction::MoveRight: return "MoveRight";
        case InputAction::Jump: return "Jump";
        case InputAction::CycleSeason: return "CycleSeason";
        case InputAction::RestartRun: return "RestartRun";
        case InputAction::Quit: return "Quit";
        default: return "Unknown";
    }
}

std::string ActionBindings::CodeToLabel(int code)
{
    if (code == kUnbound)
    {
        return "Unbound";
    }

    if (const auto it = kCodeToText.find(code); it != kCodeToText.end())
    {
        return it->second;
    }

    return "Key(" + std::to_string(code) + ")";
}
} // namespace engine::platform
