#ifndef SESSIONPROVIDER_H
#define SESSIONPROVIDER_H

namespace FieldSync {

/**
 * @brief Credential/session collaborator
 *
 * Consulted once per sync session. The engine never refreshes credentials
 * itself; an invalid session fails the sync with an authentication error.
 */
class SessionProvider
{
public:
    virtual ~SessionProvider() = default;

    virtual bool isValid() const = 0;
};

} // namespace FieldSync

#endif // SESSIONPROVIDER_H
