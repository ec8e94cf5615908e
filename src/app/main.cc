#include "app/app.h"

#include "core/log.h"

// Program entry point
// Responsible for: creating the headless app and handing control to its frame loop.
// Should NOT do: implement gameplay systems or parse configuration itself.
int main() {
    TVX_LOGI("main") << "startup";
    terravox::app::App app;

    if (!app.init()) {
        TVX_LOGE("main") << "app init failed, exiting";
        return 1;
    }

    app.run();
    app.shutdown();
    TVX_LOGI("main") << "exit success";
    return 0;
}
