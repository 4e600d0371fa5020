#pragma once

namespace ci::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

}
