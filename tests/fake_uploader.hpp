#pragma once

#include "core/uploader.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Uploader whose answers are scripted per file name
 *
 * Unscripted files succeed. A script is consumed one entry per attempt;
 * once it runs out the last entry repeats.
 */
class FakeUploader : public Uploader
{
public:
    enum class Answer
    {
        Ok,
        Transient,
        Permanent,
        Throw
    };

    SendResult send(const FileEntry &entry) override
    {
        int now_active = active_.fetch_add(1) + 1;
        int seen = max_active_.load();
        while (now_active > seen && !max_active_.compare_exchange_weak(seen, now_active))
        {
        }

        if (on_send_)
            on_send_(entry);
        if (delay_.count() > 0)
            std::this_thread::sleep_for(delay_);

        Answer answer = Answer::Ok;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const std::string name = entry.relativePath();
            ++attempts_[name];
            sent_fingerprints_.push_back(entry.fingerprint());
            auto it = scripts_.find(name);
            if (it != scripts_.end() && !it->second.empty())
            {
                answer = it->second.front();
                if (it->second.size() > 1)
                    it->second.pop_front();
            }
            if (answer == Answer::Ok)
                uploaded_.insert(name);
        }

        active_.fetch_sub(1);
        switch (answer)
        {
        case Answer::Ok:
            return SendResult::ok(entry.size(), "remote-" + entry.relativePath());
        case Answer::Transient:
            return SendResult::failure(UploadError::transient("scripted transient failure"));
        case Answer::Permanent:
            return SendResult::failure(UploadError::permanent("scripted permanent failure"));
        case Answer::Throw:
            throw std::runtime_error("scripted exception");
        }
        return SendResult::ok(entry.size(), "");
    }

    std::string name() const override { return "fake"; }

    void script(const std::string &relative_path, std::deque<Answer> answers)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        scripts_[relative_path] = std::move(answers);
    }

    void setDelay(std::chrono::milliseconds delay) { delay_ = delay; }
    void setOnSend(std::function<void(const FileEntry &)> callback) { on_send_ = std::move(callback); }

    int attempts(const std::string &relative_path) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = attempts_.find(relative_path);
        return it == attempts_.end() ? 0 : it->second;
    }

    int totalAttempts() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int total = 0;
        for (const auto &item : attempts_)
            total += item.second;
        return total;
    }

    std::set<std::string> uploaded() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return uploaded_;
    }

    std::vector<std::string> sentFingerprints() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_fingerprints_;
    }

    int maxConcurrent() const { return max_active_.load(); }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::deque<Answer>> scripts_;
    std::map<std::string, int> attempts_;
    std::set<std::string> uploaded_;
    std::vector<std::string> sent_fingerprints_;
    std::chrono::milliseconds delay_{0};
    std::function<void(const FileEntry &)> on_send_;
    std::atomic<int> active_{0};
    std::atomic<int> max_active_{0};
};
