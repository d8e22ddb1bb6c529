#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace engine::platform
{
class Input;

enum class InputAction : std::size_t
{
    MoveLeft = 0,
    MoveRight,
    Jump,
    CycleSeason,
    RestartRun,
    Quit,
    Count
};

struct ActionBinding
{
    int primary = -1;
    int secondary = -1;
};

/// Two key slots per action, persisted as JSON.
class ActionBindings
{
public:
    static constexpr int kUnbound = -1;

    ActionBindings();

    void ResetDefaults();

    [[nodiscard]] const ActionBinding& Get(InputAction action) const;
    void Set(InputAction action, const ActionBinding& binding);
    void SetCode(InputAction action, int slot, int code);
    [[nodiscard]] int GetCode(InputAction action, int slot) const;

    [[nodiscard]] bool IsDown(const Input& input, InputAction action) const;
    [[nodiscard]] bool IsPressed(const Input& input, InputAction action) const;

    [[nodiscard]] std::optional<std::pair<InputAction, int>> FindConflict(int code, InputAction ignoredAction, int ignoredSlot) const;

    [[nodiscard]] bool LoadFromJsonFile(const std::string& path, std::string* outError = nullptr);
    [[nodiscard]] bool SaveToJsonFile(const std::string& path, std::string* outError = nullptr) const;

    [[nodiscard]] static std::vector<InputAction> AllActions();
    [[nodiscard]] static const char* ActionName(InputAction action);
    [[nodiscard]] static std::string CodeToLabel(int code);

private:
    std::array<ActionBinding, static_cast<std::size_t>(InputAction::Count)> m_bindings{};
};
} // namespace engine::platform
