#pragma once
#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include "KeyValueStore.hpp"

/*
  Persistence boundary.

  save() never throws and never blocks scheduling on the result: the blob
  is a snapshot taken by the caller, failures (false or an exception from
  the store) are logged and only raise the lastSaveFailed() flag. In async
  mode each save waits for the previous one, so writes land in order.

  The flag covers a round of saves: beginRound() clears it, and any failed
  write inside the round sets it until the next round.
*/
class Persister {
public:
    Persister(std::shared_ptr<KeyValueStore> store, bool async);
    ~Persister();

    Persister(const Persister&) = delete;
    Persister& operator=(const Persister&) = delete;

    // Starts a new round of saves; waits for the previous round first.
    void beginRound();
    void save(const std::string& key, std::string blob);
    std::optional<std::string> load(const std::string& key);

    // Waits for an in-flight async save.
    void flush();

    // Waits for an in-flight save so the answer covers the latest round.
    bool lastSaveFailed();

private:
    std::shared_ptr<KeyValueStore> store;
    bool async;
    std::future<void> pending;
    std::atomic<bool> failed{ false };

    void write(const std::string& key, const std::string& blob);
};
