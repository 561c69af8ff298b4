/**
 * FreeRTOS Mock Implementation
 *
 * Minimal FreeRTOS implementation for native unit tests.
 * Uses std::thread and std::condition_variable for task/semaphore primitives.
 */

#ifdef NATIVE_BUILD

#include "freertos_mock.h"

#include <atomic>
#include <chrono>
#include <thread>

namespace freertos_mock {
    static const auto startTime = std::chrono::steady_clock::now();
    static std::atomic<uint32_t> s_tasksCreated(0);
    static std::atomic<uint32_t> s_tasksAlive(0);
    static std::atomic<uintptr_t> s_nextHandle(1);

    uint32_t tasksCreated() { return s_tasksCreated.load(); }
    uint32_t tasksAlive() { return s_tasksAlive.load(); }

    void reset() {
        s_tasksCreated = 0;
    }
}

//==============================================================================
// Semaphore Implementation
//==============================================================================

static SemaphoreHandle_t createSemaphore(uint32_t initial, uint32_t maxCount) {
    auto* sem = new freertos_mock::Semaphore();
    sem->count = initial;
    sem->maxCount = maxCount;
    return sem;
}

SemaphoreHandle_t xSemaphoreCreateMutex() {
    return createSemaphore(1, 1);
}

SemaphoreHandle_t xSemaphoreCreateBinary() {
    return createSemaphore(0, 1);
}

BaseType_t xSemaphoreTake(SemaphoreHandle_t sem, TickType_t wait) {
    if (!sem) {
        return pdFAIL;
    }

    std::unique_lock<std::mutex> lock(sem->mutex);
    auto available = [sem]() { return sem->count > 0; };

    if (wait == portMAX_DELAY) {
        sem->cv.wait(lock, available);
    } else if (!sem->cv.wait_for(lock, std::chrono::milliseconds(wait), available)) {
        return pdFAIL;
    }

    sem->count--;
    return pdPASS;
}

BaseType_t xSemaphoreGive(SemaphoreHandle_t sem) {
    if (!sem) {
        return pdFAIL;
    }

    {
        std::lock_guard<std::mutex> lock(sem->mutex);
        if (sem->count >= sem->maxCount) {
            return pdFAIL;
        }
        sem->count++;
    }
    sem->cv.notify_one();
    return pdPASS;
}

void vSemaphoreDelete(SemaphoreHandle_t sem) {
    if (sem) {
        delete sem;
    }
}

//==============================================================================
// Task Implementation
//==============================================================================

BaseType_t xTaskCreatePinnedToCore(
    TaskFunction_t taskFunction,
    const char* name,
    uint32_t stackSize,
    void* parameter,
    UBaseType_t priority,
    TaskHandle_t* handle,
    BaseType_t coreId
) {
    (void)name;
    (void)stackSize;
    (void)priority;
    (void)coreId;

    if (!taskFunction) {
        return pdFAIL;
    }

    freertos_mock::s_tasksCreated++;
    freertos_mock::s_tasksAlive++;

    if (handle) {
        *handle = reinterpret_cast<TaskHandle_t>(freertos_mock::s_nextHandle.fetch_add(1));
    }

    std::thread([taskFunction, parameter]() {
        taskFunction(parameter);
        freertos_mock::s_tasksAlive--;
    }).detach();

    return pdPASS;
}

void vTaskDelete(TaskHandle_t handle) {
    // A host thread cannot be killed; self-delete returns to the thread
    // wrapper, which ends the thread.
    (void)handle;
}

void vTaskDelay(TickType_t ticks) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ticks));
}

TickType_t xTaskGetTickCount() {
    return static_cast<TickType_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - freertos_mock::startTime).count());
}

#endif // NATIVE_BUILD
