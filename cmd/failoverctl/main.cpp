#include <cstdint>
#include <iostream>
#include <string>

#include "client/cpp/grpc_remote_client_factory.h"
#include "client/cpp/route_client.h"
#include "failover/broker/v1.hpp"

using namespace failover::broker::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  failoverctl <namesrv> send <topic> <body> [tags]\n"
            << "  failoverctl <namesrv> pull <topic> <broker_name> <queue_id> <offset> [max_nums]\n"
            << "  failoverctl <namesrv> route <topic>\n";
}

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  std::string namesrv = argv[1];
  std::string cmd     = argv[2];

  failover::client::GrpcRemoteClientFactory factory{failover::client::RemoteClientOptions{}};

  // ------------------------------------------------------------

  if (cmd == "send") {
    if (argc < 5) return 1;

    Message message;
    message.set_topic(argv[3]);
    message.set_body(argv[4]);
    if (argc >= 6) message.set_tags(argv[5]);

    auto producer = factory.CreateProducer("failoverctl");
    auto status   = producer->Start(namesrv);
    if (!status.ok()) {
      std::cerr << status.ToString() << "\n";
      return 2;
    }

    auto result = producer->Send(message);
    producer->Shutdown();
    if (!result.ok()) {
      std::cerr << result.status().ToString() << "\n";
      return 2;
    }

    std::cout << "status=" << SendStatus_Name(result->send_status()) << " msg_id=" << result->msg_id()
              << " broker=" << result->message_queue().broker_name() << " queue=" << result->message_queue().queue_id()
              << " offset=" << result->queue_offset() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "pull") {
    if (argc < 7) return 1;

    MessageQueue queue;
    queue.set_topic(argv[3]);
    queue.set_broker_name(argv[4]);
    queue.set_queue_id(std::stoi(argv[5]));
    const int64_t offset   = std::stoll(argv[6]);
    const int32_t max_nums = argc >= 8 ? std::stoi(argv[7]) : 32;

    auto consumer = factory.CreatePullConsumer("failoverctl");
    auto status   = consumer->Start(namesrv);
    if (!status.ok()) {
      std::cerr << status.ToString() << "\n";
      return 2;
    }

    auto result = consumer->Pull(queue, "*", offset, max_nums);
    consumer->Shutdown();
    if (!result.ok()) {
      std::cerr << result.status().ToString() << "\n";
      return 2;
    }

    std::cout << "status=" << PullStatus_Name(result->pull_status()) << " next=" << result->next_begin_offset()
              << " min=" << result->min_offset() << " max=" << result->max_offset() << "\n";
    for (const auto& found : result->msg_found_list()) {
      std::cout << found.queue_offset() << " " << found.msg_id() << " " << found.body() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "route") {
    auto routes = failover::client::RouteClient::Connect(namesrv, failover::client::RemoteClientOptions{}.route_timeout);
    if (!routes.ok()) {
      std::cerr << routes.status().ToString() << "\n";
      return 2;
    }

    auto route = (*routes)->GetTopicRoute(argv[3]);
    if (!route.ok()) {
      std::cerr << route.status().ToString() << "\n";
      return 2;
    }

    for (const auto& queue_data : route->queue_datas()) {
      std::cout << "queue broker=" << queue_data.broker_name() << " write=" << queue_data.write_queue_nums() << "\n";
    }
    for (const auto& broker_data : route->broker_datas()) {
      for (const auto& [id, address] : broker_data.broker_addrs()) {
        std::cout << "broker " << broker_data.broker_name() << " id=" << id << " addr=" << address << "\n";
      }
    }
    return 0;
  }

  Usage();
  return 1;
}
