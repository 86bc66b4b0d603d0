#include "Worker.hpp"
#include "NetworkCore.hpp"
#include "ReconService.hpp"
#include "../common/Codec.hpp"

#include <iostream>

namespace net_recon::server
{
    Worker::Worker(ReconService &service, size_t thread_count)
        : running_(false), thread_count_(thread_count == 0 ? 1 : thread_count), network_core_(nullptr), service_(service)
    {
    }

    Worker::~Worker()
    {
        Stop();
    }

    void Worker::Start()
    {
        running_ = true;
        for (size_t i = 0; i < thread_count_; ++i)
            threads_.emplace_back(&Worker::ProcessLoop, this);
        std::cout << "[Worker] Started " << thread_count_ << " threads\n";
    }

    void Worker::Stop()
    {
        if (!running_)
            return;

        running_ = false;
        job_queue_.Close();

        for (auto &t : threads_)
        {
            if (t.joinable())
                t.join();
        }
        threads_.clear();
    }

    void Worker::AddJob(int client_fd, uint64_t connection_id, net_recon::protocol::MessageType type, std::vector<uint8_t> payload)
    {
        if (!job_queue_.Push({client_fd, connection_id, type, std::move(payload)}))
            std::cerr << "[Worker] Dropped " << protocol::MessageTypeName(type) << " from client " << client_fd
                      << ": worker stopped\n";
    }

    void Worker::ProcessLoop()
    {
        while (auto job = job_queue_.Pop())
        {
            try
            {
                Process(*job);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Worker] Error processing job: " << e.what() << "\n";
            }
        }
    }

    void Worker::Process(const Job &job)
    {
        using net_recon::protocol::MessageType;

        ControlResponse response;
        auto body = common::wire::DecodeRequest(job.payload);
        if (!body)
            response = ReconService::Problem(400, "Bad Request", "request payload is not a length-prefixed string");
        else
            response = service_.Handle(job.type, *body);

        std::cout << "[Worker] " << protocol::MessageTypeName(job.type) << " from client " << job.client_fd
                  << " -> " << response.status << "\n";

        MessageType reply_type = response.status < 400 ? protocol::ResponseTypeFor(job.type) : MessageType::ErrorResp;
        if (network_core_)
        {
            network_core_->QueueResponse(job.client_fd, job.connection_id, reply_type,
                                         common::wire::EncodeResponse(response.status, response.body));
        }
    }
}
