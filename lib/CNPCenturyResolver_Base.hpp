#ifndef CNP_ANALYZER_CNP_CENTURY_RESOLVER_BASE_H_
#define CNP_ANALYZER_CNP_CENTURY_RESOLVER_BASE_H_

class CNPCenturyResolver_Base {
 public:
  virtual ~CNPCenturyResolver_Base() = default;

  // Stores the two-digit century prefix (18, 19 or 20) for the supplied
  // sex/century digit and two-digit year. Returns false if the digit does not
  // encode a century.
  virtual bool Resolve(int leading_digit, int year_code, int* century) const = 0;
};

#endif  // CNP_ANALYZER_CNP_CENTURY_RESOLVER_BASE_H_
