#ifndef SIGNAL_REGISTRY_HPP
#define SIGNAL_REGISTRY_HPP

#include <signal.h>
#include <unistd.h>

// Routes SIGINT and SIGTERM to AppT::stop() of one registered instance.
// AppT::stop() runs inside the signal handler, so it may only touch
// lock-free atomics and async-signal-safe calls.
template <typename AppT>
class SignalRegistry
{
   public:
    inline static AppT* instance_ = nullptr;

    static void registerInstance(AppT* instance)
    {
        instance_ = instance;

        struct sigaction action = {};
        action.sa_handler = &SignalRegistry::signalHandler;
        sigemptyset(&action.sa_mask);
        sigaction(SIGINT, &action, &previous_int_);
        sigaction(SIGTERM, &action, &previous_term_);
    }

    static void unregisterInstance()
    {
        sigaction(SIGINT, &previous_int_, nullptr);
        sigaction(SIGTERM, &previous_term_, nullptr);
        instance_ = nullptr;
    }

   private:
    static void signalHandler(int)
    {
        static const char message[] = "\nstopping capture...\n";
        ssize_t written = write(STDERR_FILENO, message, sizeof(message) - 1);
        (void)written;
        if (instance_)
            instance_->stop();
    }

    inline static struct sigaction previous_int_ = {};
    inline static struct sigaction previous_term_ = {};
};

#endif  // SIGNAL_REGISTRY_HPP
