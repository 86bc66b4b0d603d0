#pragma once

#include <thread>
#include <vector>
#include <atomic>
#include "../common/protocol.hpp"
#include "../common/ThreadSafeQueue.hpp"

namespace net_recon::server { class NetworkCore; class ReconService; }

namespace net_recon::server {

    struct Job {
        int client_fd;
        uint64_t connection_id;
        net_recon::protocol::MessageType type;
        std::vector<uint8_t> payload;
    };

    // Fixed pool of threads draining one job queue. Long requests (traceroute) only
    // occupy one thread, so the pool should be larger than one.
    class Worker {
    private:
        std::vector<std::thread> threads_;
        common::ThreadSafeQueue<Job> job_queue_;
        std::atomic<bool> running_;
        size_t thread_count_;

        NetworkCore* network_core_;
        ReconService& service_;

        void ProcessLoop();
        void Process(const Job& job);

    public:
        Worker(ReconService& service, size_t thread_count);
        ~Worker();

        void Start();
        void Stop();

        void SetNetworkCore(NetworkCore* core) { network_core_ = core; }

        void AddJob(int client_fd, uint64_t connection_id, net_recon::protocol::MessageType type, std::vector<uint8_t> payload);
    };
}
