/**
 * @file SignalRouter.hpp
 * @brief Асинхронный маршрутизатор POSIX-сигналов
 *
 * @details Реализует безопасную обработку сигналов через signalfd и epoll.
 * Используется сервисом извлечения для горячей перезагрузки шаблонов (SIGHUP)
 * и корректного завершения (SIGINT/SIGTERM).
 */
#pragma once

#include <sys/signalfd.h>
#include <unistd.h>

#include <atomic>
#include <csignal>
#include <functional>
#include <mutex>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ifx {

/**
 * @class SignalRouter
 * @brief Потокобезопасный менеджер обработки сигналов
 *
 * @note Обработчики выполняются в отдельном потоке, а не в контексте
 * сигнала, поэтому в них допустимы блокировки и ввод-вывод.
 *
 * @warning
 * - Только для Linux систем
 * - registerHandler() нужно вызывать из главного потока до создания
 *   остальных потоков, иначе сигнал может быть доставлен потоку
 *   с неблокированной маской
 */
class SignalRouter {
 public:
  using Handler = std::function<void(int)>;  ///< Тип обработчика сигналов

  /// Получить экземпляр SignalRouter (Singleton)
  static SignalRouter& instance() {
    static SignalRouter router;
    return router;
  }

  /**
   * @brief Зарегистрировать обработчик для сигнала
   * @param signum Номер сигнала (например, SIGHUP)
   * @param handler Функция-обработчик
   * @throw std::invalid_argument При неверном номере сигнала или пустом обработчике
   * @throw std::system_error При ошибках системных вызовов
   *
   * @code
   * router.registerHandler(SIGHUP, [](int) { reloadTemplates(); });
   * @endcode
   */
  void registerHandler(int signum, Handler handler);

  /**
   * @brief Удалить все обработчики для сигнала
   * @note Сигнал остаётся заблокированным и далее игнорируется
   */
  void unregisterHandler(int signum);

  /**
   * @brief Запустить поток обработки сигналов
   * @throw std::system_error При ошибках инициализации epoll
   */
  void start();

  /// Остановить поток обработки (ожидает его завершения)
  void stop() noexcept;

  bool isRunning() const noexcept { return running_; }

  ~SignalRouter();

  SignalRouter(const SignalRouter&) = delete;
  SignalRouter& operator=(const SignalRouter&) = delete;

 private:
  SignalRouter();
  void processSignals(int epollFd);
  void dispatch(int signum);

  std::unordered_map<int, std::vector<Handler>> handlers_;
  std::mutex handlers_mutex_;
  std::atomic<bool> running_{false};
  std::thread worker_thread_;
  int signal_fd_ = -1;
  sigset_t original_mask_;
  sigset_t blocked_mask_{};
};

}  // namespace ifx
