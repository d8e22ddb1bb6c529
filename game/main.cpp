#include "engine/core/App.hpp"

int main()
{
    engine::core::App app;
    return app.Run() ? 0 : 1;
}
