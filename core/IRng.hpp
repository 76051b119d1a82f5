#pragma once

#include <random>

namespace iotagent {

class IRng {
public:
    virtual ~IRng() = default;

    virtual int uniformInt(int min, int max) = 0;
};

class StandardRng : public IRng {
private:
    std::random_device rd_;
    std::mt19937 gen_;

public:
    StandardRng() : gen_(rd_()) {}
    explicit StandardRng(unsigned int seed) : gen_(seed) {}

    int uniformInt(int min, int max) override {
        std::uniform_int_distribution<int> dist(min, max);
        return dist(gen_);
    }
};

} // namespace iotagent
