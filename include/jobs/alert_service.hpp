#ifndef LUDOTECA_ALERT_SERVICE_HPP
#define LUDOTECA_ALERT_SERVICE_HPP

namespace ludoteca {

// Alert operations the built-in jobs depend on. Implementations throw
// (std::exception) to report a failed run.
class AlertService {
public:
    virtual ~AlertService() = default;

    virtual void generateOverdueAlerts() = 0;
    virtual void generateReminderAlerts() = 0;
    virtual void cleanupResolvedAlerts() = 0;
};

} // namespace ludoteca

#endif // LUDOTECA_ALERT_SERVICE_HPP
