#pragma once
#include <atomic>
#include <functional>
#include <vector>
#include "Grid.h"

// the only thing the search engine knows about whoever is watching it.
// onStep is called once per round (the engine waits for it to return),
// onSuccess exactly once with the reconstructed path when the end is reached
class SearchObserver {
public:
    virtual ~SearchObserver() = default;

    virtual void onStep() = 0;
    virtual void onSuccess(const std::vector<GridCell>& path) = 0;
};

// headless runs (tests, algorithm comparison)
class NullObserver : public SearchObserver {
public:
    void onStep() override {}
    void onSuccess(const std::vector<GridCell>&) override {}
};

// adapts plain callables, either one may be left empty
class CallbackObserver : public SearchObserver {
public:
    CallbackObserver(std::function<void()> onStep,
                     std::function<void(const std::vector<GridCell>&)> onSuccess = nullptr)
        : onStep_(std::move(onStep)), onSuccess_(std::move(onSuccess)) {}

    void onStep() override {
        if (onStep_) onStep_();
    }

    void onSuccess(const std::vector<GridCell>& path) override {
        if (onSuccess_) onSuccess_(path);
    }

private:
    std::function<void()> onStep_;
    std::function<void(const std::vector<GridCell>&)> onSuccess_;
};

// polled by the engine once per round. atomic so a host may flip it from
// outside the search thread, but nothing here requires that
class CancellationToken {
public:
    void requestCancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }
    void reset() { cancelled_.store(false); }

private:
    std::atomic<bool> cancelled_{false};
};
