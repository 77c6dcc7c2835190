/**
 * PillBridge - Session Workers
 * FreeRTOS SessionRunner: one task and one command queue per session
 */

#ifndef SESSION_TASK_H
#define SESSION_TASK_H

#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <freertos/semphr.h>
#include <freertos/task.h>

#include "config.h"
#include "session_registry.h"

class FreeRtosSessionRunner : public SessionRunner {
public:
    FreeRtosSessionRunner();
    ~FreeRtosSessionRunner() override;

    bool attach(SessionEngine& engine) override;
    void detach(SessionEngine& engine) override;
    bool post(SessionEngine& engine, const SessionCommand& command, bool urgent) override;

private:
    struct Worker {
        SessionEngine* engine;
        QueueHandle_t queue;
        TaskHandle_t task;
        SemaphoreHandle_t exited;
        volatile bool exit_requested;
    };

    static void workerTask(void* param);
    Worker* find(SessionEngine& engine);

    SemaphoreHandle_t mutex_;
    Worker workers_[PILLBRIDGE_MAX_SESSIONS];
};

#endif // SESSION_TASK_H
