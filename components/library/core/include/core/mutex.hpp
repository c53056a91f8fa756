/**
 * @file mutex.hpp
 * @brief Statically allocated FreeRTOS mutex and RAII guard
 */

#pragma once

#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>

namespace core {

/// Non-recursive mutex backed by a static FreeRTOS semaphore.
/// Creation cannot fail (no heap), so the mutex is always usable.
/// Satisfies BasicLockable.
class Mutex {
public:
  Mutex() : handle_(xSemaphoreCreateMutexStatic(&storage_)) {}

  ~Mutex() { vSemaphoreDelete(handle_); }

  Mutex(const Mutex &) = delete;
  Mutex &operator=(const Mutex &) = delete;
  Mutex(Mutex &&) = delete;
  Mutex &operator=(Mutex &&) = delete;

  void lock() { (void)xSemaphoreTake(handle_, portMAX_DELAY); }

  [[nodiscard]] bool try_lock() { return xSemaphoreTake(handle_, 0) == pdTRUE; }

  void unlock() { (void)xSemaphoreGive(handle_); }

  [[nodiscard]] SemaphoreHandle_t native_handle() const { return handle_; }

private:
  StaticSemaphore_t storage_{};
  SemaphoreHandle_t handle_;
};

/// Mutex the owning task may take again while holding it
class RecursiveMutex {
public:
  RecursiveMutex() : handle_(xSemaphoreCreateRecursiveMutexStatic(&storage_)) {}

  ~RecursiveMutex() { vSemaphoreDelete(handle_); }

  RecursiveMutex(const RecursiveMutex &) = delete;
  RecursiveMutex &operator=(const RecursiveMutex &) = delete;
  RecursiveMutex(RecursiveMutex &&) = delete;
  RecursiveMutex &operator=(RecursiveMutex &&) = delete;

  void lock() { (void)xSemaphoreTakeRecursive(handle_, portMAX_DELAY); }

  void unlock() { (void)xSemaphoreGiveRecursive(handle_); }

private:
  StaticSemaphore_t storage_{};
  SemaphoreHandle_t handle_;
};

/// RAII lock guard (like std::lock_guard)
template <typename MutexType> class LockGuard {
public:
  explicit LockGuard(MutexType &mutex) : mutex_(mutex) { mutex_.lock(); }

  ~LockGuard() { mutex_.unlock(); }

  LockGuard(const LockGuard &) = delete;
  LockGuard &operator=(const LockGuard &) = delete;
  LockGuard(LockGuard &&) = delete;
  LockGuard &operator=(LockGuard &&) = delete;

private:
  MutexType &mutex_;
};

} // namespace core
