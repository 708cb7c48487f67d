#ifndef _CON_H
#define _CON_H

#include "actypes.h"
#include "actemplates.h"
#include "acsmartptr.h"
#include "fileio.h"

#include <functional>

namespace dlbr
{

class acres;

/**
 * @brief Common functionality needed by the own jobs.
 */
class IConnBase : public tLintRefcounted
{
public:
	/**
	 * @brief Push the internal processing which is waiting for some notification
	 */
	virtual void poke(uint_fast32_t dbgId) =0;
	virtual cmstring& getClientName() =0;
};

//! Called once when the connection is finished and shall be released by its owner
using tConnReleaser = std::function<void(IConnBase*)>;

/**
 * @brief StartServing prepares the request serving stream and attached an appropriate handler to it
 * @param fd File descriptor, call of this method takes responsibility for it
 * @param clientName Client identification for the logs
 * @param onFinish Notification about the end of the connection
 * @return Connection handle, empty pointer on failure
 */
lint_ptr<IConnBase> DLBR_API StartServing(unique_fd&& fd, std::string clientName, acres&, tConnReleaser onFinish);

}

#endif
