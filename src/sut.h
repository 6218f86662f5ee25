#ifndef SGATE_SUT_H_
#define SGATE_SUT_H_

// internals of some classes are opened to the unit tests
#ifdef UNDER_TEST
#define SUTPROTECTED public
#define SUTPRIVATE public
#else
#define SUTPROTECTED protected
#define SUTPRIVATE private
#endif

#endif /* SGATE_SUT_H_ */
