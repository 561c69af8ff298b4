#pragma once

/**
 * FreeRTOS Mock for Native Unit Tests
 *
 * Provides the subset of the FreeRTOS API used by the animation engine and
 * the wake-word pipeline, backed by real host threads so concurrency tests
 * exercise genuine interleavings.
 *
 * Features:
 * - Tasks run on detached std::threads
 * - Mutex/binary semaphores with timed take (std::condition_variable)
 * - Tick count = real milliseconds since process start
 */

#ifdef NATIVE_BUILD

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace freertos_mock {

struct Semaphore {
    std::mutex mutex;
    std::condition_variable cv;
    uint32_t count;
    uint32_t maxCount;
};

} // namespace freertos_mock

// FreeRTOS Type Definitions
typedef void* TaskHandle_t;
typedef freertos_mock::Semaphore* SemaphoreHandle_t;
typedef uint32_t TickType_t;
typedef int BaseType_t;
typedef unsigned int UBaseType_t;
typedef void (*TaskFunction_t)(void*);

// FreeRTOS Constants
#define pdTRUE 1
#define pdPASS pdTRUE
#define pdFAIL 0
#define portMAX_DELAY 0xFFFFFFFF
#define portTICK_PERIOD_MS 1
#define pdMS_TO_TICKS(ms) ((TickType_t)(ms))

// Semaphore Functions
SemaphoreHandle_t xSemaphoreCreateMutex();
SemaphoreHandle_t xSemaphoreCreateBinary();
BaseType_t xSemaphoreTake(SemaphoreHandle_t sem, TickType_t wait);
BaseType_t xSemaphoreGive(SemaphoreHandle_t sem);
void vSemaphoreDelete(SemaphoreHandle_t sem);

// Task Functions
BaseType_t xTaskCreatePinnedToCore(
    TaskFunction_t taskFunction,
    const char* name,
    uint32_t stackSize,
    void* parameter,
    UBaseType_t priority,
    TaskHandle_t* handle,
    BaseType_t coreId
);
void vTaskDelete(TaskHandle_t handle);
void vTaskDelay(TickType_t ticks);
TickType_t xTaskGetTickCount();

// Mock Control Functions (for testing)
namespace freertos_mock {
    uint32_t tasksCreated();     ///< Total tasks spawned since reset()
    uint32_t tasksAlive();       ///< Task functions that have not returned
    void reset();
}

#endif // NATIVE_BUILD
