// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include <catch2/catch.hpp>

#include <thread>

#include "SafeQueue.hh"

TEST_CASE("Closed queues drain before reporting closure", "[queue]") {
    SafeQueue<int> q;
    int            val = 0;

    REQUIRE(q.push(1));
    REQUIRE(q.push(2));

    q.close();

    REQUIRE_FALSE(q.push(3));

    REQUIRE(q.pop(val));
    REQUIRE(val == 1);
    REQUIRE(q.pop(val));
    REQUIRE(val == 2);
    REQUIRE_FALSE(q.pop(val));
}

TEST_CASE("Closing a queue wakes a waiting consumer", "[queue]") {
    SafeQueue<int> q;
    bool           popped = true;

    std::thread consumer([&]() {
        int val;

        popped = q.pop(val);
    });

    q.close();
    consumer.join();

    REQUIRE_FALSE(popped);
}
