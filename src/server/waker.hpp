#pragma once


namespace minikv {

/*
 * Self-pipe used to wake the reactor out of poll().
 * notify() only calls write(2), so it is safe from a signal handler.
 */
class Waker {
public:
    Waker();
    ~Waker();

    Waker(const Waker&) = delete;
    Waker& operator=(const Waker&) = delete;

    int read_fd() const noexcept;

    void notify() noexcept;

    // Drains pending pokes
    void clear() noexcept;

private:
    int pipe_fds_[2];
};

} // namespace minikv
