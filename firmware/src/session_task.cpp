/**
 * PillBridge - Session Workers
 * Implementation
 */

#include "session_task.h"

// Queue poll period, bounds how long an exit request waits when idle
#define WORKER_RECEIVE_TIMEOUT_MS   250
#define WORKER_URGENT_SEND_MS       100

FreeRtosSessionRunner::FreeRtosSessionRunner() {
    mutex_ = xSemaphoreCreateMutex();
    for (int i = 0; i < PILLBRIDGE_MAX_SESSIONS; i++) {
        workers_[i].engine = nullptr;
        workers_[i].queue = nullptr;
        workers_[i].task = nullptr;
        workers_[i].exited = nullptr;
        workers_[i].exit_requested = false;
    }
}

FreeRtosSessionRunner::~FreeRtosSessionRunner() {
    for (int i = 0; i < PILLBRIDGE_MAX_SESSIONS; i++) {
        if (workers_[i].engine != nullptr) {
            detach(*workers_[i].engine);
        }
    }
    vSemaphoreDelete(mutex_);
}

FreeRtosSessionRunner::Worker* FreeRtosSessionRunner::find(SessionEngine& engine) {
    for (int i = 0; i < PILLBRIDGE_MAX_SESSIONS; i++) {
        if (workers_[i].engine == &engine) {
            return &workers_[i];
        }
    }
    return nullptr;
}

void FreeRtosSessionRunner::workerTask(void* param) {
    Worker* worker = static_cast<Worker*>(param);
    SessionCommand command;

    while (!worker->exit_requested) {
        if (xQueueReceive(worker->queue, &command, pdMS_TO_TICKS(WORKER_RECEIVE_TIMEOUT_MS)) == pdTRUE) {
            sessionExecute(*worker->engine, command);
        }
    }

    xSemaphoreGive(worker->exited);
    vTaskDelete(nullptr);
}

bool FreeRtosSessionRunner::attach(SessionEngine& engine) {
    xSemaphoreTake(mutex_, portMAX_DELAY);

    Worker* worker = nullptr;
    for (int i = 0; i < PILLBRIDGE_MAX_SESSIONS; i++) {
        if (workers_[i].engine == nullptr) {
            worker = &workers_[i];
            break;
        }
    }
    if (worker == nullptr) {
        xSemaphoreGive(mutex_);
        Serial.println("Session: No free worker slot");
        return false;
    }

    worker->queue = xQueueCreate(SESSION_QUEUE_DEPTH, sizeof(SessionCommand));
    worker->exited = xSemaphoreCreateBinary();
    if (worker->queue == nullptr || worker->exited == nullptr) {
        if (worker->queue) vQueueDelete(worker->queue);
        if (worker->exited) vSemaphoreDelete(worker->exited);
        worker->queue = nullptr;
        worker->exited = nullptr;
        xSemaphoreGive(mutex_);
        Serial.println("Session: Failed to allocate worker queue");
        return false;
    }

    worker->engine = &engine;
    worker->exit_requested = false;
    BaseType_t ok = xTaskCreate(workerTask, "session", SESSION_TASK_STACK_BYTES, worker,
                                SESSION_TASK_PRIORITY, &worker->task);
    if (ok != pdPASS) {
        vQueueDelete(worker->queue);
        vSemaphoreDelete(worker->exited);
        worker->engine = nullptr;
        worker->queue = nullptr;
        worker->exited = nullptr;
        worker->task = nullptr;
        xSemaphoreGive(mutex_);
        Serial.println("Session: Failed to create worker task");
        return false;
    }

    xSemaphoreGive(mutex_);
    DEBUG_PRINTLN(g_debug_session, "Session: Worker started");
    return true;
}

void FreeRtosSessionRunner::detach(SessionEngine& engine) {
    xSemaphoreTake(mutex_, portMAX_DELAY);
    Worker* worker = find(engine);
    if (worker == nullptr) {
        xSemaphoreGive(mutex_);
        return;
    }
    worker->exit_requested = true;
    xSemaphoreGive(mutex_);

    // The task may be finishing a request; it must not outlive the engine
    if (xSemaphoreTake(worker->exited, pdMS_TO_TICKS(SESSION_TASK_EXIT_TIMEOUT_MS)) != pdTRUE) {
        Serial.println("Session: Worker busy, waiting for it to finish");
        xSemaphoreTake(worker->exited, portMAX_DELAY);
    }

    xSemaphoreTake(mutex_, portMAX_DELAY);
    vQueueDelete(worker->queue);
    vSemaphoreDelete(worker->exited);
    worker->engine = nullptr;
    worker->queue = nullptr;
    worker->exited = nullptr;
    worker->task = nullptr;
    xSemaphoreGive(mutex_);
    DEBUG_PRINTLN(g_debug_session, "Session: Worker stopped");
}

bool FreeRtosSessionRunner::post(SessionEngine& engine, const SessionCommand& command, bool urgent) {
    xSemaphoreTake(mutex_, portMAX_DELAY);
    Worker* worker = find(engine);
    if (worker == nullptr || worker->exit_requested) {
        xSemaphoreGive(mutex_);
        return false;
    }

    BaseType_t ok;
    if (urgent) {
        ok = xQueueSendToFront(worker->queue, &command, pdMS_TO_TICKS(WORKER_URGENT_SEND_MS));
    } else {
        ok = xQueueSendToBack(worker->queue, &command, 0);
    }
    xSemaphoreGive(mutex_);
    return ok == pdTRUE;
}
